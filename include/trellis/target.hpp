#pragma once

#include "trellis/flags.hpp"
#include "trellis/node.hpp"
#include "trellis/toolchain.hpp"
#include "trellis/utility.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace trellis {

class Environment;
class Project;
class Target;

/// A source as declared: a path (relative to the project root), an existing node, or another target's outputs.
using Source = std::variant<std::filesystem::path, Node *, Target *>;

/**
 * @brief Declarative description of one build artifact.
 *
 * A target is configuration until the project is resolved; afterwards it also holds the nodes it produced.
 * `output_nodes()` and `object_nodes()` fail with `Unresolved` before that point.
 */
class Target {
public:
    struct Link {
        Target *target;
        bool is_public;
    };

    Target(Project &project, std::string name, TargetKind kind, Environment &env, Origin origin);

    Target(const Target &) = delete;
    Target &operator=(const Target &) = delete;

    const std::string &name() const {
        return name_;
    }
    TargetKind kind() const {
        return kind_;
    }
    Environment &env() const {
        return *env_;
    }
    Project &project() const {
        return *project_;
    }
    const Origin &origin() const {
        return origin_;
    }

    Target &add_source(Source source);
    Target &add_sources(const std::vector<Source> &sources);
    const std::vector<Source> &sources() const {
        return sources_;
    }
    /// Sources that name other targets; their nodes are only known once those targets are resolved.
    std::vector<Target *> pending_sources() const;

    /// Links `dep`; its public requirements propagate to this target and to everything that links this one.
    Target &link(Target &dep);
    /// Links `dep` for this target only.
    Target &link_private(Target &dep);
    const std::vector<Link> &links() const {
        return links_;
    }

    UsageRequirements &public_usage() {
        return public_;
    }
    const UsageRequirements &public_usage() const {
        return public_;
    }
    UsageRequirements &private_usage() {
        return private_;
    }
    const UsageRequirements &private_usage() const {
        return private_;
    }

    Target &set_output_name(std::string name);
    const std::optional<std::string> &output_name() const {
        return output_name_;
    }

    /// Command targets: the command template and the declared outputs (relative to the build directory).
    Target &set_command(std::string command);
    const std::string &command() const {
        return command_;
    }
    Target &add_output(std::filesystem::path output);
    const std::vector<std::filesystem::path> &declared_outputs() const {
        return declared_outputs_;
    }

    /// Install targets: destination directory, or destination file for `InstallAs`.
    Target &set_destination(std::filesystem::path destination);
    const std::filesystem::path &destination() const {
        return destination_;
    }

    bool resolved() const {
        return resolved_;
    }
    Result<std::span<Node *const>> output_nodes() const;
    Result<std::span<Node *const>> object_nodes() const;
    /// Languages of the objects this target compiled, in first-seen order.
    const std::vector<std::string> &languages() const {
        return languages_;
    }

private:
    friend class Resolver;

    void mark_resolved(std::vector<Node *> outputs, std::vector<Node *> objects, std::vector<std::string> languages);
    void reset();

    Project *project_;
    std::string name_;
    TargetKind kind_;
    Environment *env_;
    Origin origin_;

    std::vector<Source> sources_;
    std::vector<Link> links_;
    UsageRequirements public_;
    UsageRequirements private_;
    std::optional<std::string> output_name_;
    std::string command_;
    std::vector<std::filesystem::path> declared_outputs_;
    std::filesystem::path destination_;

    bool resolved_ = false;
    std::vector<Node *> output_nodes_;
    std::vector<Node *> object_nodes_;
    std::vector<std::string> languages_;
};

/**
 * @brief Requirements used to compile `target`'s own sources.
 *
 * Own private and public requirements, then the public requirements of every dependency reachable through public
 * links, depth first in declaration order. Diamonds are merged once.
 */
UsageRequirements collect_effective_requirements(const Target &target);

/// Link-only requirements: the effective ones plus every transitive dependency's own link libraries and flags.
UsageRequirements collect_link_requirements(const Target &target);

/// Every target reachable through links, dependents before their dependencies.
std::vector<Target *> transitive_dependencies(const Target &target);

/// Whether a target of this kind compiles sources and produces a linkable or executable output.
bool is_compiled(TargetKind kind);

} // namespace trellis
