#pragma once

#include "trellis/environment.hpp"
#include "trellis/node.hpp"
#include "trellis/target.hpp"
#include "trellis/toolchain.hpp"
#include "trellis/utility.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis {

struct ProjectOptions {
    std::filesystem::path root_dir = std::filesystem::current_path();
    std::filesystem::path build_dir = "build"; ///< Relative to `root_dir` unless absolute.
    bool echo_diagnostics = true;
};

enum class Severity { Note, Warning };

struct Diagnostic {
    Severity severity;
    std::string message;
    Origin origin;
};

/// Alias members and default targets name either a target (its outputs) or a node.
using NodeRef = std::variant<Target *, Node *>;

struct AliasDecl {
    AliasNode *node;
    std::vector<NodeRef> members;
};

/**
 * @brief Top-level registry of one build description.
 *
 * Owns the node registry, environments, targets and build invocations. `resolve()` turns the declared targets into
 * concrete nodes; generators read the result.
 */
class Project {
public:
    explicit Project(ProjectOptions options = {});

    Project(const Project &) = delete;
    Project &operator=(const Project &) = delete;
    ~Project();

    const ProjectOptions &options() const {
        return options_;
    }
    const std::filesystem::path &root_dir() const {
        return nodes_.root();
    }
    const std::filesystem::path &build_dir() const {
        return build_dir_;
    }

    NodeRegistry &nodes() {
        return nodes_;
    }
    const NodeRegistry &nodes() const {
        return nodes_;
    }

    /// A new environment seeded by `toolchain` (none when null).
    Environment &environment(std::string name = "default",
                             std::shared_ptr<const Toolchain> toolchain = std::make_shared<GnuToolchain>(),
                             Origin origin = Origin::current());
    Environment *find_environment(std::string_view name) const;
    const std::vector<std::unique_ptr<Environment>> &environments() const {
        return environments_;
    }

    /// Declares a target. A name already taken is changed to `<name>_<n>` and reported as a warning.
    Target &add_target(TargetKind kind, std::string name, Environment &env, const std::vector<Source> &sources = {},
                       Origin origin = Origin::current());
    Target &static_library(std::string name, Environment &env, const std::vector<Source> &sources = {},
                           Origin origin = Origin::current());
    Target &shared_library(std::string name, Environment &env, const std::vector<Source> &sources = {},
                           Origin origin = Origin::current());
    Target &program(std::string name, Environment &env, const std::vector<Source> &sources = {},
                    Origin origin = Origin::current());
    Target &object_library(std::string name, Environment &env, const std::vector<Source> &sources = {},
                           Origin origin = Origin::current());
    Target &interface_library(std::string name, Environment &env, Origin origin = Origin::current());
    Target &command(std::string name, Environment &env, const std::vector<std::filesystem::path> &outputs,
                    const std::vector<Source> &sources, std::string command, Origin origin = Origin::current());
    Target &install(const std::filesystem::path &destination, const std::vector<Source> &sources, Environment &env,
                    std::string name = "install", Origin origin = Origin::current());
    Target &install_as(const std::filesystem::path &destination, Source source, Environment &env,
                       std::string name = "install", Origin origin = Origin::current());

    Target *find_target(std::string_view name) const;
    const std::vector<std::unique_ptr<Target>> &targets() const {
        return targets_;
    }

    /// Groups nodes and target outputs under one name. Target members are looked up during resolution.
    AliasNode &alias(const std::string &name, const std::vector<NodeRef> &members, Origin origin = Origin::current());
    const std::vector<AliasDecl> &aliases() const {
        return aliases_;
    }

    void set_default(NodeRef ref);
    const std::vector<NodeRef> &defaults() const {
        return defaults_;
    }

    /// Resolves every declared target. Calling it again without new declarations is a no-op; after a resolved target
    /// changes, every target is resolved again.
    Result<void> resolve();
    bool resolved() const {
        return resolved_;
    }

    void add_invocation(std::shared_ptr<BuildInvocation> invocation);
    const std::vector<std::shared_ptr<BuildInvocation>> &invocations() const {
        return invocations_;
    }

    void diagnose(Severity severity, std::string message, Origin origin = {});
    const std::vector<Diagnostic> &diagnostics() const {
        return diagnostics_;
    }

private:
    friend class Environment;
    friend class Resolver;
    friend class Target;

    Environment &make_environment(std::string name, std::shared_ptr<const Toolchain> toolchain, Origin origin);
    std::string unique_target_name(std::string name, Origin origin);
    void invalidate() {
        resolved_ = false;
    }
    /// Called when `target` changes; a change to a resolved target forces every target to resolve again.
    void invalidate(const Target &target) {
        resolved_ = false;
        if (target.resolved())
            stale_ = true;
    }
    /// Forgets invocations past `mark` and the producers they set.
    void rollback(size_t mark);
    /// Forgets every invocation a target created and the producers they set.
    void drop_target_invocations();

    ProjectOptions options_;
    NodeRegistry nodes_;
    std::filesystem::path build_dir_;
    std::vector<std::unique_ptr<Environment>> environments_;
    std::vector<std::unique_ptr<Target>> targets_;
    std::vector<std::shared_ptr<BuildInvocation>> invocations_;
    std::vector<AliasDecl> aliases_;
    std::vector<NodeRef> defaults_;
    std::vector<Diagnostic> diagnostics_;
    bool resolved_ = false;
    bool stale_ = false;
};

} // namespace trellis
