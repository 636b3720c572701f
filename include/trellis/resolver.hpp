#pragma once

#include "trellis/flags.hpp"
#include "trellis/node.hpp"
#include "trellis/toolchain.hpp"
#include "trellis/utility.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace trellis {

class Project;
class Target;

/**
 * @brief Turns a project's declared targets into concrete nodes and invocations.
 *
 * Phase A resolves targets in link order (dependencies first): sources become file nodes, objects and outputs are
 * created and wired to invocations. Phase B replays the deferred install targets, whose sources are other targets'
 * outputs. The node graph is then checked for cycles and missing sources, and every command is expanded.
 *
 * A failed pass leaves the project unresolved and drops every invocation it created.
 */
class Resolver {
public:
    explicit Resolver(Project &project) : project_(project) {
    }

    Result<void> resolve();

private:
    Result<void> run();

    /// Targets with their link and source dependencies first.
    Result<std::vector<Target *>> order_targets() const;

    Result<void> resolve_target(Target &target);
    Result<void> resolve_compiled(Target &target);
    Result<void> resolve_command(Target &target);
    Result<void> resolve_install(Target &target);
    Result<void> resolve_aliases();

    Result<std::vector<Node *>> resolve_sources(const Target &target, bool flatten_dirs);
    Result<Node *> compile(const Target &target, FileNode &source, const SourceHandler &handler,
                           const UsageRequirements &reqs, const std::vector<std::string> &flags);

    Result<void> check_sources() const;
    Result<void> expand_commands() const;

    Result<void> produce(Node *output, const std::shared_ptr<BuildInvocation> &invocation);

    Project &project_;
    std::map<std::string, Node *> object_cache_;
    std::vector<Target *> resolved_here_;
};

} // namespace trellis
