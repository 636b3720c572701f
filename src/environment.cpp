#include "trellis/environment.hpp"

#include "trellis/project.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace trellis {

void ToolConfig::add_flags(const std::vector<std::string> &flags) {
    auto current = list("flags");
    current.insert(current.end(), flags.begin(), flags.end());
    set("flags", std::move(current));
}

const Value *ToolConfig::get(std::string_view var) const {
    if (auto it = vars_.find(var); it != vars_.end())
        return &it->second;
    return nullptr;
}

void ToolConfig::set(const std::string &var, Value value) {
    vars_.insert_or_assign(var, std::move(value));
}

std::vector<std::string> ToolConfig::list(std::string_view var) const {
    if (const auto *value = get(var))
        return to_sequence(*value);
    return {};
}

std::string ToolConfig::scalar(std::string_view var) const {
    if (const auto *value = get(var))
        return to_scalar(*value);
    return {};
}

void ToolConfig::add_builder(Builder builder) {
    if (builder.tool.empty())
        builder.tool = name_;
    auto name = builder.name;
    builders_.insert_or_assign(std::move(name), std::move(builder));
}

const Builder *ToolConfig::find_builder(std::string_view name) const {
    if (auto it = builders_.find(name); it != builders_.end())
        return &it->second;
    return nullptr;
}

Environment::Environment(Project &project, std::string name, size_t index,
                         std::shared_ptr<const Toolchain> toolchain, Origin origin)
    : project_(&project), name_(std::move(name)), index_(index), toolchain_(std::move(toolchain)), origin_(origin) {
    vars_.insert_or_assign("build_dir", project.build_dir().string());
    vars_.insert_or_assign("variant", std::string("default"));
}

ToolConfig &Environment::tool(const std::string &name) {
    return tools_.try_emplace(name, name).first->second;
}

const ToolConfig *Environment::find_tool(std::string_view name) const {
    if (auto it = tools_.find(name); it != tools_.end())
        return &it->second;
    return nullptr;
}

void Environment::set(std::string_view key, Value value) {
    if (auto dot = key.find('.'); dot != std::string_view::npos) {
        tool(std::string(key.substr(0, dot))).set(std::string(key.substr(dot + 1)), std::move(value));
        return;
    }
    vars_.insert_or_assign(std::string(key), std::move(value));
}

const Value *Environment::get(std::string_view key) const {
    if (auto dot = key.find('.'); dot != std::string_view::npos) {
        if (const auto *t = find_tool(key.substr(0, dot)))
            return t->get(key.substr(dot + 1));
        return nullptr;
    }
    if (auto it = vars_.find(key); it != vars_.end())
        return &it->second;
    return nullptr;
}

Namespace Environment::make_namespace() const {
    Namespace ns;
    ns.update(vars_);
    for (const auto &[name, config] : tools_)
        ns.set_scope(name, config.variables());
    return ns;
}

Result<std::string> Environment::subst(std::string_view tmpl, const Variables &overrides, Origin origin) const {
    Namespace base = make_namespace();
    Namespace layer(&base);
    layer.update(overrides);
    return expand(tmpl, layer, origin);
}

Result<std::vector<std::string>> Environment::subst_list(std::string_view tmpl, const Variables &overrides,
                                                         Origin origin) const {
    Namespace base = make_namespace();
    Namespace layer(&base);
    layer.update(overrides);
    return expand_to_sequence(tmpl, layer, origin);
}

Environment &Environment::clone(std::string name, Origin origin) const {
    if (name.empty())
        name = std::format("{}_{}", name_, project_->environments().size());

    Environment &copy = project_->make_environment(std::move(name), toolchain_, origin);
    copy.tools_ = tools_;
    copy.vars_ = vars_;
    copy.handlers_ = handlers_;
    return copy;
}

Environment &Environment::override_with(const Variables &overrides, std::string name, Origin origin) const {
    Environment &copy = clone(std::move(name), origin);
    for (const auto &[key, value] : overrides)
        copy.set(key, value);
    return copy;
}

Result<void> Environment::set_variant(std::string_view variant) {
    if (toolchain_) {
        if (auto res = toolchain_->apply_variant(*this, variant); !res)
            return res;
    }
    vars_.insert_or_assign("variant", std::string(variant));
    return {};
}

std::string Environment::variant() const {
    if (const auto *value = get("variant"))
        return to_scalar(*value);
    return "default";
}

void Environment::add_source_handler(SourceHandler handler) {
    auto suffix = handler.suffix;
    handlers_.insert_or_assign(std::move(suffix), std::move(handler));
}

const SourceHandler *Environment::source_handler(std::string_view suffix) const {
    if (auto it = handlers_.find(suffix); it != handlers_.end())
        return &it->second;
    return toolchain_ ? toolchain_->source_handler(suffix) : nullptr;
}

const SeparatedArgs &Environment::separated_arg_flags() const {
    static const SeparatedArgs none;
    return toolchain_ ? toolchain_->separated_arg_flags() : none;
}

Result<BoundBuilder> Environment::builder(std::string_view name, Origin origin) {
    for (const auto &[tool_name, config] : tools_) {
        if (const auto *b = config.find_builder(name))
            return BoundBuilder(*this, *b);
    }
    return fail(ErrorKind::Builder, std::format("environment '{}' has no builder named '{}'", name_, name), origin);
}

fs::path Environment::build_dir() const {
    if (const auto *value = get("build_dir"))
        return project_->nodes().canonical(to_scalar(*value));
    return project_->build_dir();
}

Result<FileNode *> BoundBuilder::operator()(const fs::path &output, const std::vector<fs::path> &sources,
                                            Origin origin) const {
    if (builder_.single_source && sources.size() != 1) {
        return fail(ErrorKind::Builder,
                    std::format("builder '{}' takes exactly one source, got {}", builder_.name, sources.size()),
                    origin);
    }
    if (!env_->has_tool(builder_.tool)) {
        return fail(ErrorKind::ToolNotFound,
                    std::format("builder '{}' needs tool '{}', which environment '{}' does not define",
                                builder_.name, builder_.tool, env_->name()),
                    origin);
    }

    Project &project = env_->project();
    auto invocation = std::make_shared<BuildInvocation>();
    invocation->env = env_;
    invocation->tool = builder_.tool;
    invocation->command_var = builder_.command_var;
    invocation->language = builder_.language;
    invocation->depfile = builder_.depfile;
    invocation->deps_style = builder_.deps_style;
    invocation->origin = origin;

    for (const auto &source : sources) {
        if (!builder_.src_suffixes.empty()) {
            auto suffix = source.extension().string();
            if (std::ranges::find(builder_.src_suffixes, suffix) == builder_.src_suffixes.end()) {
                return fail(ErrorKind::Builder,
                            std::format("builder '{}' does not accept '{}' sources ({})", builder_.name, suffix,
                                        source.string()),
                            origin);
            }
        }
        auto node = project.nodes().file(source, origin);
        if (!node)
            return std::unexpected(node.error());
        invocation->inputs.push_back(*node);
    }

    fs::path out_path = output;
    if (!out_path.has_extension() && !builder_.target_suffix.empty())
        out_path += builder_.target_suffix;
    if (out_path.is_relative())
        out_path = env_->build_dir() / out_path;

    auto out = project.nodes().file(out_path, origin);
    if (!out)
        return std::unexpected(out.error());
    if (auto res = (*out)->set_producer(invocation); !res)
        return std::unexpected(res.error());
    invocation->outputs.push_back(*out);

    project.add_invocation(std::move(invocation));
    return *out;
}

} // namespace trellis
