#pragma once

#include "trellis/node.hpp"
#include "trellis/subst.hpp"
#include "trellis/toolchain.hpp"
#include "trellis/utility.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

class Project;

/// A named operation a tool offers, kept as data so it can be rebound to another environment.
struct Builder {
    std::string name;
    std::string tool;
    std::string command_var;
    std::vector<std::string> src_suffixes;
    std::string target_suffix;
    std::string language;
    bool single_source = false;
    std::string depfile;
    std::string deps_style;
};

/**
 * @brief Variables of one tool (compiler, archiver, linker...).
 *
 * The well-known variables have typed accessors; anything else goes through `get`/`set`.
 */
class ToolConfig {
public:
    explicit ToolConfig(std::string name) : name_(std::move(name)) {
    }

    const std::string &name() const {
        return name_;
    }

    std::string cmd() const {
        return scalar("cmd");
    }
    void set_cmd(std::string cmd) {
        set("cmd", std::move(cmd));
    }
    std::vector<std::string> flags() const {
        return list("flags");
    }
    void set_flags(std::vector<std::string> flags) {
        set("flags", std::move(flags));
    }
    void add_flags(const std::vector<std::string> &flags);
    std::vector<std::string> includes() const {
        return list("includes");
    }
    void set_includes(std::vector<std::string> includes) {
        set("includes", std::move(includes));
    }
    std::vector<std::string> defines() const {
        return list("defines");
    }
    void set_defines(std::vector<std::string> defines) {
        set("defines", std::move(defines));
    }

    const Value *get(std::string_view var) const;
    void set(const std::string &var, Value value);
    bool contains(std::string_view var) const {
        return get(var) != nullptr;
    }
    /// The value as a sequence; empty when unset.
    std::vector<std::string> list(std::string_view var) const;
    /// The value as text; empty when unset.
    std::string scalar(std::string_view var) const;

    const Variables &variables() const {
        return vars_;
    }

    void add_builder(Builder builder);
    const Builder *find_builder(std::string_view name) const;
    const std::map<std::string, Builder, std::less<>> &builders() const {
        return builders_;
    }

private:
    std::string name_;
    Variables vars_;
    std::map<std::string, Builder, std::less<>> builders_;
};

class BoundBuilder;

/**
 * @brief Named set of tool namespaces plus cross-tool variables.
 *
 * Environments are owned by their `Project`. Clones are deep copies registered with the same project, so two
 * environments never share generated rules.
 */
class Environment {
public:
    Environment(Project &project, std::string name, size_t index, std::shared_ptr<const Toolchain> toolchain,
                Origin origin);

    Environment(const Environment &) = delete;
    Environment &operator=(const Environment &) = delete;

    const std::string &name() const {
        return name_;
    }
    /// Position in the project's environment list; also the stable identity used in cache keys.
    size_t index() const {
        return index_;
    }
    Project &project() const {
        return *project_;
    }
    const Toolchain *toolchain() const {
        return toolchain_.get();
    }
    const Origin &origin() const {
        return origin_;
    }

    ToolConfig &tool(const std::string &name);
    const ToolConfig *find_tool(std::string_view name) const;
    bool has_tool(std::string_view name) const {
        return find_tool(name) != nullptr;
    }
    const std::map<std::string, ToolConfig, std::less<>> &tools() const {
        return tools_;
    }

    /// `tool.var` keys address a tool namespace, bare keys the cross-tool variables.
    void set(std::string_view key, Value value);
    const Value *get(std::string_view key) const;
    const Variables &variables() const {
        return vars_;
    }

    Namespace make_namespace() const;

    Result<std::string> subst(std::string_view tmpl, const Variables &overrides = {},
                              Origin origin = Origin::current()) const;
    Result<std::vector<std::string>> subst_list(std::string_view tmpl, const Variables &overrides = {},
                                                Origin origin = Origin::current()) const;

    /// Deep copy, registered with the owning project. An empty name derives one from this environment's name.
    Environment &clone(std::string name = {}, Origin origin = Origin::current()) const;
    /// Clone with `overrides` applied.
    Environment &override_with(const Variables &overrides, std::string name = {},
                               Origin origin = Origin::current()) const;

    Result<void> set_variant(std::string_view variant);
    std::string variant() const;

    /// Handlers registered here take precedence over the toolchain's.
    void add_source_handler(SourceHandler handler);
    const SourceHandler *source_handler(std::string_view suffix) const;
    const SeparatedArgs &separated_arg_flags() const;

    Result<BoundBuilder> builder(std::string_view name, Origin origin = Origin::current());

    std::filesystem::path build_dir() const;

private:
    Project *project_;
    std::string name_;
    size_t index_;
    std::shared_ptr<const Toolchain> toolchain_;
    std::map<std::string, ToolConfig, std::less<>> tools_;
    Variables vars_;
    std::map<std::string, SourceHandler, std::less<>> handlers_;
    Origin origin_;

    friend class Project;
};

/**
 * @brief A builder bound to one environment.
 *
 * Calling it creates the output node and its producing invocation right away. The binding never follows clones of
 * the environment; use `rebind` to run the same operation against another one.
 */
class BoundBuilder {
public:
    BoundBuilder(Environment &env, Builder builder) : env_(&env), builder_(std::move(builder)) {
    }

    Result<FileNode *> operator()(const std::filesystem::path &output,
                                  const std::vector<std::filesystem::path> &sources,
                                  Origin origin = Origin::current()) const;

    BoundBuilder rebind(Environment &env) const {
        return BoundBuilder(env, builder_);
    }

    Environment &env() const {
        return *env_;
    }
    const Builder &builder() const {
        return builder_;
    }

private:
    Environment *env_;
    Builder builder_;
};

} // namespace trellis
