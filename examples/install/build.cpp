#include "trellis/driver.hpp"
#include "trellis/project.hpp"

#include <filesystem>
#include <print>

int main(int argc, char **argv) {
    trellis::Project project({.root_dir = std::filesystem::path(__FILE__).parent_path()});
    auto &env = project.environment();

    // Declared before the program it copies; installs are resolved after every other target.
    auto &install = project.install("stage/bin", {}, env);
    auto &tool = project.program("tool", env, {"tool.c"});
    install.add_source(&tool);

    auto &docs = project.install_as("stage/share/doc/README", std::filesystem::path("README.txt"), env, "docs");

    auto &debug = env.clone("debug");
    if (auto res = debug.set_variant("debug"); !res) {
        std::println(stderr, "error: {}", res.error().what());
        return 1;
    }
    project.program("tool_debug", debug, {"tool.c"});

    project.set_default(&install);
    project.set_default(&docs);
    return trellis::run(project, argc, argv);
}
