#include "trellis/project.hpp"

#include "trellis/resolver.hpp"

#include <algorithm>
#include <cstdio>
#include <format>
#include <iterator>
#include <print>

namespace trellis {

Project::Project(ProjectOptions options)
    : options_(std::move(options)), nodes_(options_.root_dir), build_dir_(nodes_.canonical(options_.build_dir)) {
}

Project::~Project() = default;

Environment &Project::environment(std::string name, std::shared_ptr<const Toolchain> toolchain, Origin origin) {
    Environment &env = make_environment(std::move(name), toolchain, origin);
    if (toolchain)
        toolchain->setup(env);
    return env;
}

Environment &Project::make_environment(std::string name, std::shared_ptr<const Toolchain> toolchain, Origin origin) {
    if (find_environment(name)) {
        std::string base = name;
        for (size_t n = 1; find_environment(name); ++n)
            name = std::format("{}_{}", base, n);
    }
    environments_.push_back(
        std::make_unique<Environment>(*this, std::move(name), environments_.size(), std::move(toolchain), origin));
    invalidate();
    return *environments_.back();
}

Environment *Project::find_environment(std::string_view name) const {
    for (const auto &env : environments_) {
        if (env->name() == name)
            return env.get();
    }
    return nullptr;
}

std::string Project::unique_target_name(std::string name, Origin origin) {
    if (!find_target(name))
        return name;

    std::string candidate;
    for (size_t n = 1;; ++n) {
        candidate = std::format("{}_{}", name, n);
        if (!find_target(candidate))
            break;
    }
    diagnose(Severity::Warning, std::format("target name '{}' is already taken; renamed to '{}'", name, candidate),
             origin);
    return candidate;
}

Target &Project::add_target(TargetKind kind, std::string name, Environment &env, const std::vector<Source> &sources,
                            Origin origin) {
    name = unique_target_name(std::move(name), origin);
    targets_.push_back(std::make_unique<Target>(*this, std::move(name), kind, env, origin));
    Target &target = *targets_.back();
    target.add_sources(sources);
    invalidate();
    return target;
}

Target &Project::static_library(std::string name, Environment &env, const std::vector<Source> &sources,
                                Origin origin) {
    return add_target(TargetKind::StaticLibrary, std::move(name), env, sources, origin);
}

Target &Project::shared_library(std::string name, Environment &env, const std::vector<Source> &sources,
                                Origin origin) {
    return add_target(TargetKind::SharedLibrary, std::move(name), env, sources, origin);
}

Target &Project::program(std::string name, Environment &env, const std::vector<Source> &sources, Origin origin) {
    return add_target(TargetKind::Program, std::move(name), env, sources, origin);
}

Target &Project::object_library(std::string name, Environment &env, const std::vector<Source> &sources,
                                Origin origin) {
    return add_target(TargetKind::Object, std::move(name), env, sources, origin);
}

Target &Project::interface_library(std::string name, Environment &env, Origin origin) {
    return add_target(TargetKind::Interface, std::move(name), env, {}, origin);
}

Target &Project::command(std::string name, Environment &env, const std::vector<std::filesystem::path> &outputs,
                         const std::vector<Source> &sources, std::string command, Origin origin) {
    Target &target = add_target(TargetKind::Command, std::move(name), env, sources, origin);
    target.set_command(std::move(command));
    for (const auto &output : outputs)
        target.add_output(output);
    return target;
}

Target &Project::install(const std::filesystem::path &destination, const std::vector<Source> &sources,
                         Environment &env, std::string name, Origin origin) {
    Target &target = add_target(TargetKind::Install, std::move(name), env, sources, origin);
    target.set_destination(destination);
    return target;
}

Target &Project::install_as(const std::filesystem::path &destination, Source source, Environment &env,
                            std::string name, Origin origin) {
    Target &target = add_target(TargetKind::InstallAs, std::move(name), env, {std::move(source)}, origin);
    target.set_destination(destination);
    return target;
}

Target *Project::find_target(std::string_view name) const {
    for (const auto &target : targets_) {
        if (target->name() == name)
            return target.get();
    }
    return nullptr;
}

AliasNode &Project::alias(const std::string &name, const std::vector<NodeRef> &members, Origin origin) {
    AliasNode *node = nodes_.alias(name, origin);
    auto it = std::ranges::find_if(aliases_, [&](const AliasDecl &decl) { return decl.node == node; });
    if (it == aliases_.end()) {
        aliases_.push_back({node, {}});
        it = std::prev(aliases_.end());
    }
    for (const auto &member : members) {
        it->members.push_back(member);
        if (auto *const *n = std::get_if<Node *>(&member))
            node->add_member(*n);
    }
    invalidate();
    return *node;
}

void Project::set_default(NodeRef ref) {
    defaults_.push_back(ref);
}

Result<void> Project::resolve() {
    if (resolved_)
        return {};
    return Resolver(*this).resolve();
}

void Project::add_invocation(std::shared_ptr<BuildInvocation> invocation) {
    invocations_.push_back(std::move(invocation));
    invalidate();
}

void Project::rollback(size_t mark) {
    for (size_t i = mark; i < invocations_.size(); ++i) {
        const auto &invocation = invocations_[i];
        for (auto *output : invocation->outputs) {
            if (output->producer_ptr() == invocation)
                output->clear_producer();
        }
    }
    invocations_.resize(std::min(mark, invocations_.size()));
}

void Project::drop_target_invocations() {
    std::vector<std::shared_ptr<BuildInvocation>> kept;
    for (auto &invocation : invocations_) {
        if (!invocation->owner) {
            kept.push_back(std::move(invocation));
            continue;
        }
        for (auto *output : invocation->outputs) {
            if (output->producer_ptr() == invocation)
                output->clear_producer();
        }
    }
    invocations_ = std::move(kept);
}

void Project::diagnose(Severity severity, std::string message, Origin origin) {
    if (options_.echo_diagnostics) {
        std::string_view label = severity == Severity::Warning ? "warning" : "note";
        if (has_origin(origin))
            std::println(stderr, "{}: {}: {}", label, format_origin(origin), message);
        else
            std::println(stderr, "{}: {}", label, message);
    }
    diagnostics_.push_back({severity, std::move(message), origin});
}

} // namespace trellis
