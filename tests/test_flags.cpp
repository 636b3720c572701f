#include "trellis/flags.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace trellis;
using Strings = std::vector<std::string>;

TEST(FlagsTest, MergeUniqueKeepsFirstSeenOrder) {
    Strings into{"-Wall", "-O2"};
    merge_unique(into, {"-O2", "-g", "-Wall", "-g"});
    EXPECT_EQ(into, (Strings{"-Wall", "-O2", "-g"}));
}

TEST(FlagsTest, SeparatedArgumentsStayPaired) {
    SeparatedArgs separated{"-isystem"};
    Strings into{"-isystem", "a"};
    merge_flags(into, {"-isystem", "b", "-isystem", "a", "-O2"}, separated);
    EXPECT_EQ(into, (Strings{"-isystem", "a", "-isystem", "b", "-O2"}));
}

TEST(FlagsTest, UnknownSeparatedFlagIsMergedTokenByToken) {
    Strings into{"-F", "a"};
    merge_flags(into, {"-F", "b"}, {});
    EXPECT_EQ(into, (Strings{"-F", "a", "b"}));
}

TEST(FlagsTest, UsageMergeIsAssociative) {
    UsageRequirements a;
    a.include_dirs = {"inc_a", "shared"};
    a.defines = {"A"};
    UsageRequirements b;
    b.include_dirs = {"shared", "inc_b"};
    b.defines = {"B", "A"};
    b.link_libs = {"m"};
    UsageRequirements c;
    c.include_dirs = {"inc_c", "inc_a"};
    c.link_libs = {"m", "dl"};

    UsageRequirements left = a;
    left.merge(b);
    left.merge(c);

    UsageRequirements bc = b;
    bc.merge(c);
    UsageRequirements right = a;
    right.merge(bc);

    EXPECT_EQ(left, right);
    EXPECT_EQ(left.include_dirs.size(), 4u);
    EXPECT_EQ(left.link_libs, (Strings{"m", "dl"}));
}

TEST(FlagsTest, MergeLinkLeavesCompileRequirements) {
    UsageRequirements into;
    UsageRequirements other;
    other.include_dirs = {"inc"};
    other.defines = {"X"};
    other.link_flags = {"-pthread"};
    other.link_dirs = {"lib"};

    into.merge_link(other);
    EXPECT_TRUE(into.include_dirs.empty());
    EXPECT_TRUE(into.defines.empty());
    EXPECT_EQ(into.link_flags, (Strings{"-pthread"}));
    EXPECT_EQ(into.link_dirs.size(), 1u);
    EXPECT_FALSE(into.empty());
    EXPECT_TRUE(UsageRequirements{}.empty());
}
