#include "trellis/target.hpp"

#include "trellis/environment.hpp"
#include "trellis/project.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <set>

namespace trellis {

Target::Target(Project &project, std::string name, TargetKind kind, Environment &env, Origin origin)
    : project_(&project), name_(std::move(name)), kind_(kind), env_(&env), origin_(origin) {
}

Target &Target::add_source(Source source) {
    sources_.push_back(std::move(source));
    project_->invalidate(*this);
    return *this;
}

Target &Target::add_sources(const std::vector<Source> &sources) {
    for (const auto &source : sources)
        add_source(source);
    return *this;
}

std::vector<Target *> Target::pending_sources() const {
    std::vector<Target *> out;
    for (const auto &source : sources_) {
        if (const auto *target = std::get_if<Target *>(&source))
            out.push_back(*target);
    }
    return out;
}

Target &Target::link(Target &dep) {
    links_.push_back({&dep, true});
    project_->invalidate(*this);
    return *this;
}

Target &Target::link_private(Target &dep) {
    links_.push_back({&dep, false});
    project_->invalidate(*this);
    return *this;
}

Target &Target::set_output_name(std::string name) {
    output_name_ = std::move(name);
    project_->invalidate(*this);
    return *this;
}

Target &Target::set_command(std::string command) {
    command_ = std::move(command);
    project_->invalidate(*this);
    return *this;
}

Target &Target::add_output(std::filesystem::path output) {
    declared_outputs_.push_back(std::move(output));
    project_->invalidate(*this);
    return *this;
}

Target &Target::set_destination(std::filesystem::path destination) {
    destination_ = std::move(destination);
    project_->invalidate(*this);
    return *this;
}

Result<std::span<Node *const>> Target::output_nodes() const {
    if (!resolved_)
        return fail(ErrorKind::Unresolved, std::format("outputs of target '{}' queried before resolution", name_),
                    origin_);
    return std::span<Node *const>(output_nodes_);
}

Result<std::span<Node *const>> Target::object_nodes() const {
    if (!resolved_)
        return fail(ErrorKind::Unresolved, std::format("objects of target '{}' queried before resolution", name_),
                    origin_);
    return std::span<Node *const>(object_nodes_);
}

void Target::mark_resolved(std::vector<Node *> outputs, std::vector<Node *> objects,
                           std::vector<std::string> languages) {
    output_nodes_ = std::move(outputs);
    object_nodes_ = std::move(objects);
    languages_ = std::move(languages);
    resolved_ = true;
}

void Target::reset() {
    output_nodes_.clear();
    object_nodes_.clear();
    languages_.clear();
    resolved_ = false;
}

namespace {

// Public requirements of `target` plus those of everything it links publicly.
void collect_interface(const Target &target, const SeparatedArgs &separated, UsageRequirements &out,
                       std::set<const Target *> &visited) {
    if (!visited.insert(&target).second)
        return;
    out.merge(target.public_usage(), separated);
    for (const auto &link : target.links()) {
        if (link.is_public)
            collect_interface(*link.target, separated, out, visited);
    }
}

} // namespace

UsageRequirements collect_effective_requirements(const Target &target) {
    const auto &separated = target.env().separated_arg_flags();

    UsageRequirements out;
    out.merge(target.private_usage(), separated);
    out.merge(target.public_usage(), separated);

    std::set<const Target *> visited{&target};
    for (const auto &link : target.links())
        collect_interface(*link.target, separated, out, visited);
    return out;
}

UsageRequirements collect_link_requirements(const Target &target) {
    const auto &separated = target.env().separated_arg_flags();

    UsageRequirements out = collect_effective_requirements(target);
    for (const auto *dep : transitive_dependencies(target)) {
        out.merge_link(dep->private_usage(), separated);
        out.merge_link(dep->public_usage(), separated);
    }
    return out;
}

std::vector<Target *> transitive_dependencies(const Target &target) {
    std::vector<Target *> post_order;
    std::set<const Target *> visited{&target};

    std::function<void(const Target &)> visit = [&](const Target &t) {
        for (const auto &link : t.links()) {
            if (visited.insert(link.target).second) {
                visit(*link.target);
                post_order.push_back(link.target);
            }
        }
    };
    visit(target);

    std::reverse(post_order.begin(), post_order.end());
    return post_order;
}

bool is_compiled(TargetKind kind) {
    switch (kind) {
    case TargetKind::StaticLibrary:
    case TargetKind::SharedLibrary:
    case TargetKind::Program:
    case TargetKind::Object:
        return true;
    default:
        return false;
    }
}

} // namespace trellis
