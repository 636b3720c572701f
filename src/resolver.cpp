#include "trellis/resolver.hpp"

#include "trellis/environment.hpp"
#include "trellis/graph.hpp"
#include "trellis/project.hpp"
#include "trellis/target.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <map>

namespace fs = std::filesystem;

namespace trellis {

namespace {

void add_unique(std::vector<std::string> &list, const std::string &item) {
    if (!item.empty() && std::ranges::find(list, item) == list.end())
        list.push_back(item);
}

void add_unique(std::vector<Node *> &list, Node *node) {
    if (std::ranges::find(list, node) == list.end())
        list.push_back(node);
}

std::string rule_safe(std::string_view name) {
    std::string out;
    for (char c : name)
        out.push_back(std::isalnum(static_cast<unsigned char>(c)) || c == '_' ? c : '_');
    return out;
}

} // namespace

Result<void> Resolver::resolve() {
    if (project_.stale_) {
        project_.diagnose(Severity::Note, "a resolved target changed; resolving every target again");
        for (const auto &target : project_.targets())
            target->reset();
        project_.drop_target_invocations();
        project_.stale_ = false;
    }

    size_t mark = project_.invocations_.size();
    if (auto res = run(); !res) {
        for (auto *target : resolved_here_)
            target->reset();
        project_.rollback(mark);
        project_.resolved_ = false;
        return res;
    }
    project_.resolved_ = true;
    return {};
}

Result<void> Resolver::run() {
    auto order = order_targets();
    if (!order)
        return std::unexpected(order.error());

    // Phase A: everything but installs, dependencies first.
    std::vector<Target *> deferred;
    for (auto *target : *order) {
        if (target->resolved())
            continue;
        if (target->kind() == TargetKind::Install || target->kind() == TargetKind::InstallAs) {
            deferred.push_back(target);
            continue;
        }
        if (auto res = resolve_target(*target); !res)
            return res;
    }

    // Phase B: installs see every output.
    for (auto *target : deferred) {
        if (auto res = resolve_install(*target); !res)
            return res;
    }

    if (auto res = resolve_aliases(); !res)
        return res;

    if (auto sorted = BuildGraph::from_project(project_).topo_sort(); !sorted)
        return std::unexpected(sorted.error());

    if (auto res = check_sources(); !res)
        return res;
    return expand_commands();
}

Result<std::vector<Target *>> Resolver::order_targets() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::map<const Target *, STATUS> status;
    std::vector<Target *> order;
    std::vector<Target *> path;

    std::function<Result<void>(Target *)> dfs = [&](Target *t) -> Result<void> {
        status[t] = STATUS::WORKING;
        path.push_back(t);

        std::vector<Target *> deps;
        for (const auto &link : t->links())
            deps.push_back(link.target);
        for (auto *source : t->pending_sources())
            deps.push_back(source);

        for (auto *dep : deps) {
            auto s = status[dep];
            if (s == STATUS::UNSTARTED) {
                if (auto res = dfs(dep); !res)
                    return res;
            } else if (s == STATUS::WORKING) {
                std::vector<std::string> chain;
                for (auto it = std::ranges::find(path, dep); it != path.end(); ++it)
                    chain.push_back((*it)->name());
                chain.push_back(dep->name());
                return std::unexpected(Error{ErrorKind::DependencyCycle,
                                             std::format("dependency cycle between targets: {}", join(chain, " -> ")),
                                             dep->origin(), chain});
            }
        }

        path.pop_back();
        status[t] = STATUS::FINISHED;
        order.push_back(t);
        return {};
    };

    for (const auto &target : project_.targets()) {
        if (status[target.get()] == STATUS::UNSTARTED) {
            if (auto res = dfs(target.get()); !res)
                return std::unexpected(res.error());
        }
    }
    return order;
}

Result<void> Resolver::resolve_target(Target &target) {
    switch (target.kind()) {
    case TargetKind::Interface:
        target.mark_resolved({}, {}, {});
        resolved_here_.push_back(&target);
        return {};
    case TargetKind::Command:
        return resolve_command(target);
    case TargetKind::Install:
    case TargetKind::InstallAs:
        return resolve_install(target);
    default:
        return resolve_compiled(target);
    }
}

Result<std::vector<Node *>> Resolver::resolve_sources(const Target &target, bool flatten_dirs) {
    std::vector<Node *> out;
    NodeRegistry &registry = project_.nodes();

    std::function<void(Node *)> push = [&](Node *node) {
        if (auto *dir = dynamic_cast<DirNode *>(node); dir && flatten_dirs) {
            for (auto *member : dir->members())
                push(member);
            return;
        }
        add_unique(out, node);
    };

    for (const auto &source : target.sources()) {
        if (const auto *path = std::get_if<fs::path>(&source)) {
            if (auto *existing = registry.find(*path)) {
                push(existing);
                continue;
            }
            auto node = registry.file(*path, target.origin());
            if (!node)
                return std::unexpected(node.error());
            push(*node);
        } else if (auto *const *node = std::get_if<Node *>(&source)) {
            push(*node);
        } else {
            const Target *dep = std::get<Target *>(source);
            auto outputs = dep->output_nodes();
            if (!outputs) {
                return fail(ErrorKind::Unresolved,
                            std::format("target '{}' uses the outputs of '{}', which is not resolved yet",
                                        target.name(), dep->name()),
                            target.origin());
            }
            for (auto *node : *outputs)
                push(node);
        }
    }
    return out;
}

Result<void> Resolver::produce(Node *output, const std::shared_ptr<BuildInvocation> &invocation) {
    if (auto res = output->set_producer(invocation); !res)
        return res;
    add_unique(invocation->outputs, output);
    return {};
}

Result<Node *> Resolver::compile(const Target &target, FileNode &source, const SourceHandler &handler,
                                 const UsageRequirements &reqs, const std::vector<std::string> &flags) {
    Environment &env = target.env();
    NodeRegistry &registry = project_.nodes();

    std::vector<std::string> includes;
    for (const auto &dir : reqs.include_dirs)
        includes.push_back(registry.canonical(dir).string());

    std::string key = std::format("{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}", source.path().string(), env.index(),
                                  handler.tool, handler.command_var, join(includes, "\x1e"),
                                  join(reqs.defines, "\x1e"), join(flags, "\x1e"));
    if (auto it = object_cache_.find(key); it != object_cache_.end())
        return it->second;

    fs::path rel = source.path().lexically_relative(registry.root());
    if (rel.empty() || *rel.begin() == "..")
        rel = fs::path("_ext") / source.path().relative_path();
    fs::path obj_path = env.build_dir() / std::format("obj.{}", target.name()) / rel;
    obj_path += handler.object_suffix;

    auto obj = registry.file(obj_path, target.origin());
    if (!obj)
        return std::unexpected(obj.error());

    auto invocation = std::make_shared<BuildInvocation>();
    invocation->env = &env;
    invocation->tool = handler.tool;
    invocation->command_var = handler.command_var;
    invocation->language = handler.language;
    invocation->inputs.push_back(&source);
    invocation->depfile = handler.depfile;
    invocation->deps_style = handler.deps_style;
    invocation->owner = &target;
    invocation->origin = target.origin();

    auto &include_tokens = invocation->variables["includes"];
    for (const auto &dir : includes)
        include_tokens.push_back({"-I", dir, true});
    auto &define_tokens = invocation->variables["defines"];
    for (const auto &define : reqs.defines)
        define_tokens.push_back({"-D", define, false});
    auto &flag_tokens = invocation->variables["extra_flags"];
    for (const auto &flag : flags)
        flag_tokens.push_back({"", flag, false});

    project_.add_invocation(invocation);
    if (auto res = produce(*obj, invocation); !res)
        return std::unexpected(res.error());
    object_cache_.emplace(std::move(key), *obj);
    return *obj;
}

Result<void> Resolver::resolve_compiled(Target &target) {
    Environment &env = target.env();
    const Toolchain *toolchain = env.toolchain();
    const auto &separated = env.separated_arg_flags();

    auto sources = resolve_sources(target, true);
    if (!sources)
        return std::unexpected(sources.error());

    UsageRequirements reqs = collect_effective_requirements(target);
    std::vector<std::string> flags;
    if (toolchain)
        flags = toolchain->compile_flags_for(target.kind());
    merge_flags(flags, reqs.compile_flags, separated);

    std::vector<Node *> objects;
    std::vector<std::string> languages;
    for (auto *node : *sources) {
        auto *file = dynamic_cast<FileNode *>(node);
        if (!file) {
            project_.diagnose(Severity::Warning,
                              std::format("{} '{}': '{}' is not a file and cannot be compiled; skipped",
                                          to_string(target.kind()), target.name(), node->name()),
                              target.origin());
            continue;
        }

        auto suffix = file->path().extension().string();
        const SourceHandler *handler = env.source_handler(suffix);
        if (!handler) {
            project_.diagnose(Severity::Warning,
                              std::format("{} '{}': no source handler for '{}' ({}); skipped", to_string(target.kind()),
                                          target.name(), suffix, file->path().string()),
                              target.origin());
            continue;
        }
        if (!env.has_tool(handler->tool)) {
            return fail(ErrorKind::ToolNotFound,
                        std::format("'{}' sources need tool '{}', which environment '{}' does not define (target '{}')",
                                    suffix, handler->tool, env.name(), target.name()),
                        target.origin());
        }

        auto obj = compile(target, *file, *handler, reqs, flags);
        if (!obj)
            return std::unexpected(obj.error());
        add_unique(objects, *obj);
        add_unique(languages, handler->language);
    }

    if (sources->empty()) {
        project_.diagnose(Severity::Warning,
                          std::format("{} '{}' has no sources", to_string(target.kind()), target.name()),
                          target.origin());
    }

    if (target.kind() == TargetKind::Object) {
        target.mark_resolved(objects, objects, languages);
        resolved_here_.push_back(&target);
        return {};
    }

    std::vector<Node *> inputs = objects;
    for (auto *dep : transitive_dependencies(target)) {
        auto dep_outputs = dep->output_nodes();
        if (!dep_outputs)
            return std::unexpected(dep_outputs.error());

        switch (dep->kind()) {
        case TargetKind::Object:
            for (auto *node : *dep_outputs)
                add_unique(inputs, node);
            break;
        case TargetKind::StaticLibrary:
        case TargetKind::SharedLibrary:
            if (target.kind() != TargetKind::StaticLibrary) {
                for (auto *node : *dep_outputs)
                    add_unique(inputs, node);
            }
            break;
        default:
            continue;
        }
        for (const auto &language : dep->languages())
            add_unique(languages, language);
    }

    if (!toolchain) {
        return fail(ErrorKind::ToolNotFound,
                    std::format("environment '{}' has no toolchain to link {} '{}'", env.name(),
                                to_string(target.kind()), target.name()),
                    target.origin());
    }
    LinkStep step = toolchain->link_step(target.kind(), languages);
    if (!env.has_tool(step.tool)) {
        return fail(ErrorKind::ToolNotFound,
                    std::format("{} '{}' needs tool '{}', which environment '{}' does not define",
                                to_string(target.kind()), target.name(), step.tool, env.name()),
                    target.origin());
    }

    std::string file_name = target.output_name().value_or(toolchain->output_name(target.kind(), target.name()));
    auto out = project_.nodes().file(env.build_dir() / file_name, target.origin());
    if (!out)
        return std::unexpected(out.error());

    auto invocation = std::make_shared<BuildInvocation>();
    invocation->env = &env;
    invocation->tool = step.tool;
    invocation->command_var = step.command_var;
    invocation->inputs = inputs;
    invocation->owner = &target;
    invocation->origin = target.origin();

    if (target.kind() != TargetKind::StaticLibrary) {
        UsageRequirements link_reqs = collect_link_requirements(target);
        auto &ldflags = invocation->variables["ldflags"];
        for (const auto &flag : link_reqs.link_flags)
            ldflags.push_back({"", flag, false});
        auto &libdirs = invocation->variables["libdirs"];
        for (const auto &dir : link_reqs.link_dirs)
            libdirs.push_back({"-L", project_.nodes().canonical(dir).string(), true});
        auto &libs = invocation->variables["libs"];
        for (const auto &lib : link_reqs.link_libs)
            libs.push_back({"-l", lib, false});
    }

    project_.add_invocation(invocation);
    if (auto res = produce(*out, invocation); !res)
        return res;

    target.mark_resolved({*out}, objects, languages);
    resolved_here_.push_back(&target);
    return {};
}

Result<void> Resolver::resolve_command(Target &target) {
    Environment &env = target.env();

    auto sources = resolve_sources(target, false);
    if (!sources)
        return std::unexpected(sources.error());

    if (target.declared_outputs().empty()) {
        return fail(ErrorKind::Builder, std::format("command target '{}' declares no outputs", target.name()),
                    target.origin());
    }
    if (target.command().empty()) {
        return fail(ErrorKind::Builder, std::format("command target '{}' has no command", target.name()),
                    target.origin());
    }

    auto invocation = std::make_shared<BuildInvocation>();
    invocation->env = &env;
    invocation->tool = "command";
    invocation->command_template = target.command();
    invocation->rule_name = std::format("command_{}", rule_safe(target.name()));
    invocation->inputs = *sources;
    invocation->description = std::format("GEN {}", target.name());
    invocation->owner = &target;
    invocation->origin = target.origin();

    project_.add_invocation(invocation);
    std::vector<Node *> outputs;
    for (const auto &declared : target.declared_outputs()) {
        fs::path path = declared.is_absolute() ? declared : env.build_dir() / declared;
        auto out = project_.nodes().file(path, target.origin());
        if (!out)
            return std::unexpected(out.error());
        if (auto res = produce(*out, invocation); !res)
            return res;
        add_unique(outputs, *out);
    }

    target.mark_resolved(outputs, {}, {});
    resolved_here_.push_back(&target);
    return {};
}

Result<void> Resolver::resolve_install(Target &target) {
    Environment &env = target.env();

    auto sources = resolve_sources(target, true);
    if (!sources)
        return std::unexpected(sources.error());

    if (!env.has_tool("copy")) {
        return fail(ErrorKind::ToolNotFound,
                    std::format("install target '{}' needs tool 'copy', which environment '{}' does not define",
                                target.name(), env.name()),
                    target.origin());
    }

    fs::path destination = target.destination();
    if (destination.is_relative())
        destination = env.build_dir() / destination;
    destination = project_.nodes().canonical(destination);

    if (target.kind() == TargetKind::InstallAs && sources->size() != 1) {
        return fail(ErrorKind::Builder,
                    std::format("install target '{}' copies to a single path but has {} sources", target.name(),
                                sources->size()),
                    target.origin());
    }
    if (sources->empty()) {
        project_.diagnose(Severity::Warning, std::format("install target '{}' has no sources", target.name()),
                          target.origin());
    }

    std::vector<Node *> outputs;
    for (auto *source : *sources) {
        fs::path source_path = node_path(*source);
        if (source_path.empty()) {
            return fail(ErrorKind::Builder,
                        std::format("install target '{}' cannot copy '{}': not a file", target.name(), source->name()),
                        target.origin());
        }

        fs::path out_path =
            target.kind() == TargetKind::InstallAs ? destination : destination / source_path.filename();
        auto out = project_.nodes().file(out_path, target.origin());
        if (!out)
            return std::unexpected(out.error());

        auto invocation = std::make_shared<BuildInvocation>();
        invocation->env = &env;
        invocation->tool = "copy";
        invocation->command_var = "copycmd";
        invocation->inputs.push_back(source);
        invocation->owner = &target;
        invocation->origin = target.origin();
        project_.add_invocation(invocation);
        if (auto res = produce(*out, invocation); !res)
            return res;
        add_unique(outputs, *out);
    }

    target.mark_resolved(outputs, {}, {});
    resolved_here_.push_back(&target);
    return {};
}

Result<void> Resolver::resolve_aliases() {
    for (const auto &decl : project_.aliases()) {
        for (const auto &member : decl.members) {
            const auto *const *target = std::get_if<Target *>(&member);
            if (!target)
                continue;
            auto outputs = (*target)->output_nodes();
            if (!outputs)
                return std::unexpected(outputs.error());
            for (auto *node : *outputs)
                decl.node->add_member(node);
        }
    }
    return {};
}

Result<void> Resolver::check_sources() const {
    auto check = [](const Node *node, const BuildInvocation &invocation) -> Result<void> {
        const auto *file = dynamic_cast<const FileNode *>(node);
        if (!file || file->producer())
            return {};
        std::error_code ec;
        if (!fs::exists(file->path(), ec)) {
            return fail(ErrorKind::MissingSource,
                        std::format("source file {} does not exist and nothing builds it", file->path().string()),
                        invocation.origin);
        }
        return {};
    };

    for (const auto &invocation : project_.invocations()) {
        for (const auto *inputs : {&invocation->inputs, &invocation->implicit_inputs}) {
            for (const auto *node : *inputs) {
                if (const auto *dir = dynamic_cast<const DirNode *>(node)) {
                    for (const auto *member : dir->members()) {
                        if (auto res = check(member, *invocation); !res)
                            return res;
                    }
                } else if (auto res = check(node, *invocation); !res) {
                    return res;
                }
            }
        }
    }
    return {};
}

Result<void> Resolver::expand_commands() const {
    std::map<const Environment *, Namespace> namespaces;

    for (const auto &invocation : project_.invocations()) {
        if (!invocation->command.empty())
            continue;

        const Environment *env = invocation->env;
        std::string tmpl = invocation->command_template;
        if (tmpl.empty()) {
            const ToolConfig *tool = env->find_tool(invocation->tool);
            if (!tool) {
                return fail(ErrorKind::ToolNotFound,
                            std::format("environment '{}' does not define tool '{}'", env->name(), invocation->tool),
                            invocation->origin);
            }
            const Value *value = tool->get(invocation->command_var);
            if (!value) {
                return fail(ErrorKind::MissingVariable,
                            std::format("undefined variable: ${}.{}", invocation->tool, invocation->command_var),
                            invocation->origin);
            }
            tmpl = to_scalar(*value);
        }

        auto it = namespaces.find(env);
        if (it == namespaces.end())
            it = namespaces.emplace(env, env->make_namespace()).first;

        auto command = expand_to_sequence(tmpl, it->second, invocation->origin);
        if (!command)
            return std::unexpected(command.error());
        invocation->command = std::move(*command);
    }
    return {};
}

} // namespace trellis
