#include "trellis/driver.hpp"
#include "trellis/project.hpp"

#include <filesystem>

int main(int argc, char **argv) {
    trellis::Project project({.root_dir = std::filesystem::path(__FILE__).parent_path()});
    auto &env = project.environment();
    env.tool("cc").set_flags({"-Wall", "-O2"});

    auto &hello = project.program("hello", env, {"hello.c"});
    project.set_default(&hello);
    return trellis::run(project, argc, argv);
}
