#pragma once

#include "trellis/node.hpp"
#include "trellis/utility.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

class Project;

struct GeneratorConfig {
    std::string build_file = "build.ninja";
    bool compile_commands = true;
    bool mermaid = false;
    std::string mermaid_file = "deps.mmd";
};

/**
 * @brief Serializes a resolved project into one output file.
 *
 * Generators only render text; `generate()` decides where and whether to write it.
 */
class Generator {
public:
    virtual ~Generator() = default;

    virtual std::string file_name() const = 0;
    /// Renders the file for `project`, with paths relative to `output_dir`.
    virtual Result<std::string> render(const Project &project, const std::filesystem::path &output_dir) const = 0;
};

/// `build.ninja`: one rule per environment, tool and command; one build statement per invocation.
class NinjaGenerator : public Generator {
public:
    explicit NinjaGenerator(std::string file_name = "build.ninja") : file_name_(std::move(file_name)) {
    }

    std::string file_name() const override {
        return file_name_;
    }
    Result<std::string> render(const Project &project, const std::filesystem::path &output_dir) const override;

private:
    std::string file_name_;
};

/// `compile_commands.json` for editors and analyzers.
class CompileCommandsGenerator : public Generator {
public:
    std::string file_name() const override {
        return "compile_commands.json";
    }
    Result<std::string> render(const Project &project, const std::filesystem::path &output_dir) const override;
};

/// Target-level dependency flowchart in Mermaid syntax.
class MermaidGenerator : public Generator {
public:
    explicit MermaidGenerator(std::string file_name = "deps.mmd") : file_name_(std::move(file_name)) {
    }

    std::string file_name() const override {
        return file_name_;
    }
    Result<std::string> render(const Project &project, const std::filesystem::path &output_dir) const override;

private:
    std::string file_name_;
};

/**
 * @brief Renders every configured generator for a resolved project and writes the results into `output_dir`.
 *
 * Nothing is written unless every generator succeeds. Files are written to a temporary name and renamed into place.
 * Value nodes are materialized under `<output_dir>/.values/`, rewritten only when their value changed.
 */
Result<void> generate(const Project &project, const std::filesystem::path &output_dir,
                      const GeneratorConfig &config = {});

Result<void> write_file_atomic(const std::filesystem::path &path, std::string_view content);

/// `path` relative to `base`, in generic form.
std::string relative_path(const std::filesystem::path &path, const std::filesystem::path &base);
/// Ninja path escaping: `$`, space and `:`.
std::string escape_path(std::string_view path);
/// File a value node is materialized to.
std::filesystem::path value_file(const std::filesystem::path &output_dir, const ValueNode &node);
/// Paths a node stands for as a build input; a source directory stands for its members.
std::vector<std::string> input_paths(const Node &node, const std::filesystem::path &output_dir);
/// The token as a command argument: prefix plus value, with paths made relative to `output_dir`.
std::string render_token(const CommandToken &token, const std::filesystem::path &output_dir);

/// Ninja `$in`, `$out` and per-build variables, rendered for one invocation.
using Bindings = std::map<std::string, std::vector<std::string>, std::less<>>;
Bindings bindings_for(const BuildInvocation &invocation, const std::filesystem::path &output_dir);
/// Evaluates ninja variable references in one rule token. A token that is a single reference yields one argument per
/// bound value.
std::vector<std::string> evaluate_token(std::string_view token, const Bindings &bindings);

} // namespace trellis
