#include "trellis/driver.hpp"

#include "trellis/project.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <print>
#include <string>
#include <string_view>

namespace trellis {

namespace {

void print_help(std::string_view program) {
    std::println("Usage: {} [options]", program);
    std::println("Options:");
    std::println("  -h, --help       Show this help message");
    std::println("  -v, --version    Show version");
    std::println("  -o <dir>         Write build files to <dir> (default: the build directory)");
    std::println("  --no-compdb      Do not write compile_commands.json");
    std::println("  --mermaid        Also write a Mermaid dependency graph (deps.mmd)");
    std::println("  --dry-run        Print build.ninja to stdout instead of writing files");
}

void print_version() {
    std::println("trellis {}", TRELLIS_VERSION);
}

void print_error(const Error &err) {
    std::println(std::cerr, "error: {}", err.what());
}

} // namespace

int run(Project &project, int argc, const char *const *argv) {
    DriverConfig config;
    std::string_view program = argc > 0 ? argv[0] : "trellis";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help(program);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-o") {
            if (i + 1 < argc) {
                config.output_dir = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for -o");
                return 1;
            }
        } else if (arg == "--no-compdb") {
            config.generator.compile_commands = false;
        } else if (arg == "--mermaid") {
            config.generator.mermaid = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help(program);
            return 1;
        }
    }

    if (auto res = project.resolve(); !res) {
        print_error(res.error());
        return 1;
    }

    std::filesystem::path output_dir =
        config.output_dir.empty() ? project.build_dir() : project.nodes().canonical(config.output_dir);

    if (config.dry_run) {
        auto content = NinjaGenerator(config.generator.build_file).render(project, output_dir);
        if (!content) {
            print_error(content.error());
            return 1;
        }
        std::print("{}", *content);
        return 0;
    }

    if (auto res = generate(project, output_dir, config.generator); !res) {
        print_error(res.error());
        return 1;
    }
    std::println("trellis: wrote {}", (output_dir / config.generator.build_file).string());
    return 0;
}

} // namespace trellis
