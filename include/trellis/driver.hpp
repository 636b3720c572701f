#pragma once

#include "trellis/generator.hpp"

#include <filesystem>

namespace trellis {

class Project;

struct DriverConfig {
    std::filesystem::path output_dir; ///< Empty: the project's build directory.
    GeneratorConfig generator;
    bool dry_run = false;
};

/**
 * @brief Command-line entry point for build description programs.
 *
 * Parses `argv`, resolves `project` and generates its build files. Returns the process exit code; diagnostics go to
 * stderr.
 */
int run(Project &project, int argc, const char *const *argv);

} // namespace trellis
