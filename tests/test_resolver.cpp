#include "testing_utils.hpp"

#include "trellis/project.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace trellis;
using Strings = std::vector<std::string>;

class ResolverTest : public ScratchTest {
protected:
    static const BuildInvocation *producer_of(const Target &target) {
        auto outputs = target.output_nodes();
        if (!outputs || outputs->empty())
            return nullptr;
        return outputs->front()->producer();
    }

    static bool has_input(const BuildInvocation &invocation, const Node *node) {
        return std::ranges::find(invocation.inputs, node) != invocation.inputs.end();
    }
};

TEST_F(ResolverTest, ProgramLinksItsLibrary) {
    touch("src/util.c", "int util() { return 1; }");
    touch("src/main.c");

    Project project(options());
    Environment &env = project.environment();
    Target &util = project.static_library("util", env, {"src/util.c"});
    Target &app = project.program("app", env, {"src/main.c"});
    app.link(util);

    auto res = project.resolve();
    ASSERT_TRUE(res) << res.error().what();
    EXPECT_TRUE(project.resolved());

    auto lib_out = util.output_nodes();
    ASSERT_TRUE(lib_out);
    ASSERT_EQ(lib_out->size(), 1u);
    EXPECT_EQ(node_path(*lib_out->front()), root / "build" / "libutil.a");

    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects->size(), 1u);
    EXPECT_EQ(node_path(*objects->front()), root / "build" / "obj.app" / "src" / "main.c.o");

    const auto *link = producer_of(app);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->tool, "cc");
    EXPECT_EQ(link->command_var, "progcmd");
    EXPECT_TRUE(has_input(*link, objects->front()));
    EXPECT_TRUE(has_input(*link, lib_out->front()));

    const auto *archive = producer_of(util);
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->command, (Strings{"ar", "rcs", "$out", "$in"}));
}

TEST_F(ResolverTest, CompileCommandIsExpanded) {
    touch("main.c");

    Project project(options());
    Environment &env = project.environment();
    env.tool("cc").set_flags({"-O2"});
    Target &app = project.program("app", env, {"main.c"});

    ASSERT_TRUE(project.resolve());
    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    const auto *compile = objects->front()->producer();
    ASSERT_NE(compile, nullptr);
    EXPECT_EQ(compile->command, (Strings{"gcc", "-O2", "$includes", "$defines", "$extra_flags", "-MMD", "-MF",
                                         "$out.d", "-c", "-o", "$out", "$in"}));
    EXPECT_EQ(compile->language, "c");
    EXPECT_EQ(compile->depfile, "$out.d");
    EXPECT_EQ(compile->deps_style, "gcc");
}

TEST_F(ResolverTest, ResolvingTwiceChangesNothing) {
    touch("main.c");

    Project project(options());
    Environment &env = project.environment();
    Target &app = project.program("app", env, {"main.c"});

    ASSERT_TRUE(project.resolve());
    size_t invocations = project.invocations().size();
    size_t nodes = project.nodes().size();
    auto first = app.output_nodes();
    ASSERT_TRUE(first);
    const Node *output = first->front();

    ASSERT_TRUE(project.resolve());
    EXPECT_EQ(project.invocations().size(), invocations);
    EXPECT_EQ(project.nodes().size(), nodes);
    auto second = app.output_nodes();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->front(), output);
}

TEST_F(ResolverTest, LateDeclarationsResolveIncrementally) {
    touch("a.c");
    touch("b.c");

    Project project(options());
    Environment &env = project.environment();
    project.program("a", env, {"a.c"});
    ASSERT_TRUE(project.resolve());
    size_t before = project.invocations().size();

    Target &b = project.program("b", env, {"b.c"});
    EXPECT_FALSE(project.resolved());
    ASSERT_TRUE(project.resolve());
    EXPECT_TRUE(b.resolved());
    EXPECT_EQ(project.invocations().size(), before * 2);
}

TEST_F(ResolverTest, LinkingAfterResolveResolvesAgain) {
    touch("src/main.c");
    touch("src/util.c", "int util() { return 1; }");
    touch("src/hello.c");

    Project project(options());
    Environment &env = project.environment();
    auto object = env.builder("Object");
    ASSERT_TRUE(object);
    auto hello = (*object)("hello", {"src/hello.c"});
    ASSERT_TRUE(hello) << hello.error().what();

    Target &app = project.program("app", env, {"src/main.c"});
    ASSERT_TRUE(project.resolve());
    EXPECT_EQ(project.invocations().size(), 3u);

    Target &util = project.static_library("util", env, {"src/util.c"});
    util.public_usage().defines.push_back("HAVE_UTIL");
    app.link(util);
    EXPECT_FALSE(project.resolved());

    auto res = project.resolve();
    ASSERT_TRUE(res) << res.error().what();
    EXPECT_TRUE(app.resolved());
    EXPECT_EQ(project.invocations().size(), 5u);

    auto lib_out = util.output_nodes();
    ASSERT_TRUE(lib_out);
    const auto *link = producer_of(app);
    ASSERT_NE(link, nullptr);
    EXPECT_TRUE(has_input(*link, lib_out->front()));

    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects->size(), 1u);
    const auto *compile = objects->front()->producer();
    ASSERT_NE(compile, nullptr);
    const auto &defines = compile->variables.at("defines");
    ASSERT_EQ(defines.size(), 1u);
    EXPECT_EQ(defines.front().value, "HAVE_UTIL");

    ASSERT_NE((*hello)->producer(), nullptr);
    EXPECT_EQ(project.invocations().front()->owner, nullptr);
    ASSERT_FALSE(project.diagnostics().empty());
    EXPECT_EQ(project.diagnostics().back().severity, Severity::Note);
}

TEST_F(ResolverTest, SameNamedSourcesOutsideTheRootGetDistinctObjects) {
    touch("a/util.c", "int a() { return 1; }");
    touch("b/util.c", "int b() { return 2; }");
    touch("proj/main.c");

    Project project({root / "proj", "build", false});
    Environment &env = project.environment();
    Target &app = project.program("app", env, {"main.c", root / "a" / "util.c", root / "b" / "util.c"});

    auto res = project.resolve();
    ASSERT_TRUE(res) << res.error().what();

    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects->size(), 3u);
    fs::path ext = root / "proj" / "build" / "obj.app" / "_ext" / root.lexically_normal().relative_path();
    EXPECT_EQ(node_path(*(*objects)[1]), ext / "a" / "util.c.o");
    EXPECT_EQ(node_path(*(*objects)[2]), ext / "b" / "util.c.o");
}

TEST_F(ResolverTest, InstallDeclaredBeforeItsSourceTarget) {
    touch("main.c");

    Project project(options());
    Environment &env = project.environment();
    Target &install = project.install("bin", {}, env);
    Target &app = project.program("app", env, {"main.c"});
    install.add_source(&app);

    auto res = project.resolve();
    ASSERT_TRUE(res) << res.error().what();

    auto outputs = install.output_nodes();
    ASSERT_TRUE(outputs);
    ASSERT_EQ(outputs->size(), 1u);
    EXPECT_EQ(node_path(*outputs->front()), root / "build" / "bin" / "app");

    const auto *copy = outputs->front()->producer();
    ASSERT_NE(copy, nullptr);
    auto app_out = app.output_nodes();
    ASSERT_TRUE(app_out);
    EXPECT_TRUE(has_input(*copy, app_out->front()));
    EXPECT_EQ(copy->command, (Strings{"cp", "$in", "$out"}));
}

TEST_F(ResolverTest, InstallAsTakesExactlyOneSource) {
    touch("a.txt");
    touch("b.txt");

    Project project(options());
    Environment &env = project.environment();
    Target &one = project.install_as("share/readme.txt", std::filesystem::path("a.txt"), env);
    one.add_source(std::filesystem::path("b.txt"));

    auto res = project.resolve();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::Builder);
}

TEST_F(ResolverTest, TargetCycleNamesBothTargets) {
    touch("a.c");
    touch("b.c");

    Project project(options());
    Environment &env = project.environment();
    Target &a = project.static_library("A", env, {"a.c"});
    Target &b = project.static_library("B", env, {"b.c"});
    a.link(b);
    b.link(a);

    auto res = project.resolve();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::DependencyCycle);
    const auto &chain = res.error().chain;
    EXPECT_NE(std::ranges::find(chain, std::string("A")), chain.end());
    EXPECT_NE(std::ranges::find(chain, std::string("B")), chain.end());
    EXPECT_FALSE(project.resolved());
    EXPECT_TRUE(project.invocations().empty());
}

TEST_F(ResolverTest, NodeCycleIsRejected) {
    Project project(options());
    Environment &env = project.environment();
    auto a = project.nodes().file(root / "build" / "a.txt");
    auto b = project.nodes().file(root / "build" / "b.txt");
    ASSERT_TRUE(a && b);

    project.command("make_a", env, {"a.txt"}, {*b}, "cp $$in $$out");
    project.command("make_b", env, {"b.txt"}, {*a}, "cp $$in $$out");

    auto res = project.resolve();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::DependencyCycle);
    EXPECT_TRUE(project.invocations().empty());
    EXPECT_EQ((*a)->producer(), nullptr);
}

TEST_F(ResolverTest, MissingSourceIsReported) {
    Project project(options());
    Environment &env = project.environment();
    project.program("app", env, {"nope.c"});

    auto res = project.resolve();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::MissingSource);
    EXPECT_NE(res.error().message.find("nope.c"), std::string::npos);
    EXPECT_FALSE(project.resolved());
}

TEST_F(ResolverTest, MissingToolIsReported) {
    touch("main.c");

    Project project(options());
    Environment &env = project.environment("bare", nullptr);
    env.add_source_handler(SourceHandler{.suffix = ".c", .tool = "cc", .language = "c"});
    project.program("app", env, {"main.c"});

    auto res = project.resolve();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().kind, ErrorKind::ToolNotFound);
    EXPECT_NE(res.error().message.find(".c"), std::string::npos);
    EXPECT_NE(res.error().message.find("cc"), std::string::npos);
}

TEST_F(ResolverTest, IdenticalCompilesShareAnObject) {
    touch("common.c", "int common() { return 0; }");
    touch("a.c");
    touch("b.c");

    Project project(options());
    Environment &env = project.environment();
    Target &a = project.object_library("objs", env, {"common.c", "a.c"});
    Target &b = project.object_library("objs_copy", env, {"a.c"});
    b.add_source(std::filesystem::path("common.c"));
    b.private_usage().defines.push_back("OTHER");
    Target &c = project.object_library("objs_same", env, {"common.c"});

    ASSERT_TRUE(project.resolve());
    auto a_objs = a.object_nodes();
    auto b_objs = b.object_nodes();
    auto c_objs = c.object_nodes();
    ASSERT_TRUE(a_objs && b_objs && c_objs);

    EXPECT_EQ(c_objs->front(), a_objs->front());
    EXPECT_NE(b_objs->back(), a_objs->front());
}

TEST_F(ResolverTest, SharedLibraryObjectsArePositionIndependent) {
    touch("lib.c");

    Project project(options());
    Environment &env = project.environment();
    Target &lib = project.shared_library("plugin", env, {"lib.c"});

    ASSERT_TRUE(project.resolve());
    auto objects = lib.object_nodes();
    ASSERT_TRUE(objects);
    const auto &flags = objects->front()->producer()->variables.at("extra_flags");
    ASSERT_EQ(flags.size(), 1u);
    EXPECT_EQ(flags.front().value, "-fPIC");

    const auto *link = producer_of(lib);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->command_var, "sharedcmd");
    EXPECT_EQ(node_path(*link->outputs.front()), root / "build" / "libplugin.so");
}

TEST_F(ResolverTest, CxxSourcesSelectTheCxxLinker) {
    touch("util.c");
    touch("main.cpp");

    Project project(options());
    Environment &env = project.environment();
    Target &util = project.static_library("util", env, {"util.c"});
    Target &app = project.program("app", env, {"main.cpp"});
    app.link(util);

    ASSERT_TRUE(project.resolve());
    EXPECT_EQ(producer_of(app)->tool, "cxx");
    EXPECT_EQ(producer_of(util)->tool, "ar");
}

TEST_F(ResolverTest, CxxDependencyPromotesTheLinker) {
    touch("util.cpp");
    touch("main.c");

    Project project(options());
    Environment &env = project.environment();
    Target &util = project.static_library("util", env, {"util.cpp"});
    Target &app = project.program("app", env, {"main.c"});
    app.link(util);

    ASSERT_TRUE(project.resolve());
    EXPECT_EQ(producer_of(app)->tool, "cxx");
}

TEST_F(ResolverTest, UsageRequirementsReachTheCommandVariables) {
    touch("lib/lib.c");
    touch("main.c");

    Project project(options());
    Environment &env = project.environment();
    Target &lib = project.static_library("lib", env, {"lib/lib.c"});
    lib.public_usage().include_dirs.push_back("lib/include");
    lib.public_usage().defines.push_back("USE_LIB");
    lib.public_usage().link_libs.push_back("m");
    Target &app = project.program("app", env, {"main.c"});
    app.link(lib);

    ASSERT_TRUE(project.resolve());
    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    const auto &vars = objects->front()->producer()->variables;
    ASSERT_EQ(vars.at("includes").size(), 1u);
    EXPECT_EQ(vars.at("includes").front().prefix, "-I");
    EXPECT_EQ(vars.at("includes").front().value, (root / "lib" / "include").string());
    EXPECT_TRUE(vars.at("includes").front().is_path);
    ASSERT_EQ(vars.at("defines").size(), 1u);
    EXPECT_EQ(vars.at("defines").front().value, "USE_LIB");

    const auto &libs = producer_of(app)->variables.at("libs");
    ASSERT_EQ(libs.size(), 1u);
    EXPECT_EQ(libs.front().prefix, "-l");
    EXPECT_EQ(libs.front().value, "m");
}

TEST_F(ResolverTest, CommandTargetFeedsAProgram) {
    touch("gen.py", "print('int main() { return 0; }')");

    Project project(options());
    Environment &env = project.environment();
    Target &gen = project.command("gen", env, {"gen/main.c"}, {"gen.py"}, "python3 $$in > $$out");
    Target &app = project.program("app", env, {&gen});

    auto res = project.resolve();
    ASSERT_TRUE(res) << res.error().what();

    auto generated = gen.output_nodes();
    ASSERT_TRUE(generated);
    EXPECT_EQ(node_path(*generated->front()), root / "build" / "gen" / "main.c");
    const auto *step = generated->front()->producer();
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->command, (Strings{"python3", "$in", ">", "$out"}));
    EXPECT_EQ(step->rule_name, "command_gen");

    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    ASSERT_EQ(objects->size(), 1u);
    EXPECT_TRUE(has_input(*objects->front()->producer(), generated->front()));
}

TEST_F(ResolverTest, TargetWithoutSourcesWarns) {
    Project project(options());
    Environment &env = project.environment();
    project.static_library("empty", env);

    ASSERT_TRUE(project.resolve());
    ASSERT_FALSE(project.diagnostics().empty());
    EXPECT_NE(project.diagnostics().back().message.find("has no sources"), std::string::npos);
}

TEST_F(ResolverTest, UnknownSuffixIsSkippedWithAWarning) {
    touch("main.c");
    touch("notes.txt");

    Project project(options());
    Environment &env = project.environment();
    Target &app = project.program("app", env, {"main.c", "notes.txt"});

    ASSERT_TRUE(project.resolve());
    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    EXPECT_EQ(objects->size(), 1u);
    ASSERT_EQ(project.diagnostics().size(), 1u);
    EXPECT_NE(project.diagnostics().front().message.find(".txt"), std::string::npos);
}

TEST_F(ResolverTest, SourceDirectoryContributesItsMembers) {
    touch("src/a.c");
    touch("src/b.c");

    Project project(options());
    Environment &env = project.environment();
    auto dir = project.nodes().dir("src", DirRole::Source);
    ASSERT_TRUE(dir);
    for (const auto *name : {"src/a.c", "src/b.c"}) {
        auto file = project.nodes().file(name);
        ASSERT_TRUE(file);
        (*dir)->add_member(*file);
    }
    Target &app = project.program("app", env, {*dir});

    ASSERT_TRUE(project.resolve());
    auto objects = app.object_nodes();
    ASSERT_TRUE(objects);
    EXPECT_EQ(objects->size(), 2u);
}
