#include "trellis/driver.hpp"
#include "trellis/project.hpp"

#include <filesystem>
#include <print>

// greet (C) <- shout (C++) <- app. The program picks up greet's include directory through shout's public link and is
// linked with the C++ driver because shout contains C++ code.
int main(int argc, char **argv) {
    trellis::Project project({.root_dir = std::filesystem::path(__FILE__).parent_path()});
    auto &env = project.environment();
    if (auto res = env.set_variant("release"); !res) {
        std::println(stderr, "error: {}", res.error().what());
        return 1;
    }

    auto &greet = project.static_library("greet", env, {"lib/greet.c"});
    greet.public_usage().include_dirs.push_back("lib/include");
    greet.private_usage().defines.push_back("GREETING=\"hello from greet\"");

    auto &shout = project.static_library("shout", env, {"lib/shout.cpp"});
    shout.link(greet);

    auto &app = project.program("app", env, {"main.c"});
    app.link(shout);

    project.alias("libs", {&greet, &shout});
    project.set_default(&app);
    return trellis::run(project, argc, argv);
}
