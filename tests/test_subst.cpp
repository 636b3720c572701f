#include "trellis/subst.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace trellis;
using Strings = std::vector<std::string>;

TEST(SubstTest, TemplateWithoutReferencesIsUnchanged) {
    Namespace ns;
    ns.set("cc.cmd", "gcc");

    auto out = expand("gcc -c foo.c -o 'foo bar.o'", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, "gcc -c foo.c -o 'foo bar.o'");
}

TEST(SubstTest, ToolScopedSequenceJoinsInScalarContext) {
    Namespace ns;
    ns.set("cc.flags", Strings{"-O2"});

    auto out = expand("$cc.flags -c", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, "-O2 -c");
}

TEST(SubstTest, EscapedDollarIsNotRescanned) {
    Namespace ns;
    ns.set("a", "x");

    auto out = expand("$$a $$$a", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, "$a $x");
}

TEST(SubstTest, ValuesAreExpandedRecursively) {
    Namespace ns;
    ns.set("cc.cmd", "gcc");
    ns.set("compile", "$cc.cmd -c");
    ns.set("cmd", "$compile $$in");

    auto out = expand("$cmd", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, "gcc -c $in");
}

TEST(SubstTest, BracedReferenceAndTrailingDot) {
    Namespace ns;
    ns.set("name", "foo");

    auto out = expand("${name}bar $name.", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, "foobar foo.");
}

TEST(SubstTest, CircularReferenceReportsTheChain) {
    Namespace ns;
    ns.set("a", "$b");
    ns.set("b", "$a");

    auto out = expand("$a", ns);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::CircularReference);
    EXPECT_EQ(out.error().chain, (Strings{"a", "b", "a"}));
    EXPECT_NE(out.error().message.find("a -> b -> a"), std::string::npos);
}

TEST(SubstTest, SelfReferenceIsCircular) {
    Namespace ns;
    ns.set("cc.flags", "$cc.flags -O2");

    auto out = expand_to_sequence("$cc.flags", ns);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::CircularReference);
}

TEST(SubstTest, MissingVariableIsNamed) {
    Namespace ns;

    auto out = expand("gcc $missing.var", ns);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::MissingVariable);
    EXPECT_NE(out.error().message.find("missing.var"), std::string::npos);
}

TEST(SubstTest, BareNameDoesNotSearchToolScopes) {
    Namespace ns;
    ns.set("cc.flags", Strings{"-O2"});

    auto out = expand("$flags", ns);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().kind, ErrorKind::MissingVariable);
}

TEST(SubstTest, SequenceKeepsElementsWithSpaces) {
    Namespace ns;
    ns.set("cc.cmd", "gcc");
    ns.set("defs", Strings{"-DMSG=hello world", "-DX"});

    auto out = expand_to_sequence("$cc.cmd $defs -c", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, (Strings{"gcc", "-DMSG=hello world", "-DX", "-c"}));
}

TEST(SubstTest, ScalarReferenceIsSplitIntoTokens) {
    Namespace ns;
    ns.set("cmd", "gcc -O2");

    auto out = expand_to_sequence("$cmd x.c", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, (Strings{"gcc", "-O2", "x.c"}));
}

TEST(SubstTest, EmptySequenceContributesNoTokens) {
    Namespace ns;
    ns.set("link.flags", Strings{});

    auto out = expand_to_sequence("gcc $link.flags -o $$out", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, (Strings{"gcc", "-o", "$out"}));
}

TEST(SubstTest, ListFunctions) {
    Namespace ns;
    ns.set("incs", Strings{"a", "b"});

    auto prefixed = expand_to_sequence("${prefix(-I, incs)}", ns);
    ASSERT_TRUE(prefixed) << prefixed.error().what();
    EXPECT_EQ(*prefixed, (Strings{"-Ia", "-Ib"}));

    auto suffixed = expand_to_sequence("${suffix(incs, .o)}", ns);
    ASSERT_TRUE(suffixed) << suffixed.error().what();
    EXPECT_EQ(*suffixed, (Strings{"a.o", "b.o"}));

    auto wrapped = expand_to_sequence("${wrap(<, incs, >)}", ns);
    ASSERT_TRUE(wrapped) << wrapped.error().what();
    EXPECT_EQ(*wrapped, (Strings{"<a>", "<b>"}));

    auto paired = expand_to_sequence("${pairwise(-isystem, incs)}", ns);
    ASSERT_TRUE(paired) << paired.error().what();
    EXPECT_EQ(*paired, (Strings{"-isystem", "a", "-isystem", "b"}));

    auto joined = expand("${join(:, incs)}", ns);
    ASSERT_TRUE(joined) << joined.error().what();
    EXPECT_EQ(*joined, "a:b");
}

TEST(SubstTest, FunctionOverToolScopedList) {
    Namespace ns;
    ns.set("link.libs", Strings{"m", "pthread"});

    auto out = expand_to_sequence("gcc ${prefix(-l, link.libs)}", ns);
    ASSERT_TRUE(out) << out.error().what();
    EXPECT_EQ(*out, (Strings{"gcc", "-lm", "-lpthread"}));
}

TEST(SubstTest, FunctionErrors) {
    Namespace ns;
    ns.set("incs", Strings{"a"});

    auto unknown = expand("${nope(a)}", ns);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().kind, ErrorKind::Substitution);

    auto arity = expand("${prefix(incs)}", ns);
    ASSERT_FALSE(arity);
    EXPECT_EQ(arity.error().kind, ErrorKind::Substitution);

    auto unterminated = expand("${incs", ns);
    ASSERT_FALSE(unterminated);
    EXPECT_EQ(unterminated.error().kind, ErrorKind::Substitution);
}

TEST(SubstTest, LayerShadowsParent) {
    Namespace base;
    base.set("x", "1");
    base.set("y", "base");
    Namespace layer(&base);
    layer.set("x", "2");

    auto layered = expand("$x $y", layer);
    ASSERT_TRUE(layered) << layered.error().what();
    EXPECT_EQ(*layered, "2 base");

    auto plain = expand("$x", base);
    ASSERT_TRUE(plain);
    EXPECT_EQ(*plain, "1");
}

TEST(SubstTest, QuoteForShell) {
    EXPECT_EQ(quote_for_shell("abc"), "abc");
    EXPECT_EQ(quote_for_shell("-DX=1"), "-DX=1");
    EXPECT_EQ(quote_for_shell("a b"), "'a b'");
    EXPECT_EQ(quote_for_shell(""), "''");
    EXPECT_EQ(quote_for_shell("it's"), "\"it's\"");
    EXPECT_EQ(quote_for_shell("it's $HOME"), "\"it's \\$HOME\"");
}

TEST(SubstTest, EscapeDollars) {
    EXPECT_EQ(escape_dollars("a$b$$c"), "a$$b$$$$c");
    EXPECT_EQ(escape_dollars("plain"), "plain");
}
