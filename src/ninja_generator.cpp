#include "trellis/environment.hpp"
#include "trellis/generator.hpp"
#include "trellis/project.hpp"
#include "trellis/subst.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace trellis {

namespace {

std::string rule_safe(std::string_view name) {
    std::string out;
    for (char c : name)
        out.push_back(std::isalnum(static_cast<unsigned char>(c)) || c == '_' ? c : '_');
    return out;
}

// Rule template tokens are already in shell syntax; only tokens that came from a list element containing
// whitespace need quoting.
std::string render_command(const std::vector<std::string> &tokens) {
    std::string out;
    for (const auto &token : tokens) {
        if (!out.empty())
            out.push_back(' ');
        bool needs_quotes = token.find('$') == std::string::npos &&
                            (token.empty() || std::ranges::any_of(token, [](char c) {
                                 return std::isspace(static_cast<unsigned char>(c));
                             }));
        out += needs_quotes ? quote_for_shell(token) : token;
    }
    return out;
}

std::string render_variable(const std::vector<CommandToken> &tokens, const fs::path &output_dir) {
    std::string out;
    for (const auto &token : tokens) {
        if (!out.empty())
            out.push_back(' ');
        out += escape_dollars(quote_for_shell(render_token(token, output_dir)));
    }
    return out;
}

std::string upper(std::string_view s) {
    std::string out;
    for (char c : s)
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
}

class NinjaWriter {
public:
    NinjaWriter(const Project &project, fs::path output_dir) : project_(project), output_dir_(std::move(output_dir)) {
    }

    std::string render() {
        for (const auto &invocation : project_.invocations())
            write_build(*invocation);
        write_directories();
        write_aliases();
        write_target_phonies();
        write_defaults();

        std::string out = "# This file is generated by trellis. Do not edit.\n\n";
        out += "ninja_required_version = 1.3\n\n";
        out += std::format("builddir = {}\n", escape_path(relative_path(project_.build_dir(), output_dir_)));
        out += std::format("topdir = {}\n\n", escape_path(relative_path(project_.root_dir(), output_dir_)));
        out += rules_;
        out += builds_;
        return out;
    }

private:
    std::string paths(const std::vector<Node *> &nodes, std::set<std::string> *seen = nullptr) const {
        std::string out;
        for (const auto *node : nodes) {
            for (const auto &path : input_paths(*node, output_dir_)) {
                if (seen && !seen->insert(path).second)
                    continue;
                out += ' ';
                out += escape_path(path);
            }
        }
        return out;
    }

    std::string rule_for(const BuildInvocation &invocation) {
        const Environment *env = invocation.env;

        std::string base = invocation.rule_name.empty()
                               ? std::format("{}_{}", rule_safe(invocation.tool), rule_safe(invocation.command_var))
                               : invocation.rule_name;
        if (env && env->index() > 0)
            base += std::format("_{}", rule_safe(env->name()));

        std::string command = render_command(invocation.command);
        std::string signature = std::format("{}\n{}\n{}", base, env ? env->index() : 0, command);
        if (auto it = rule_names_.find(signature); it != rule_names_.end())
            return it->second;

        // Same name, different environment or command: sanitized names collided, or the environment changed
        // between passes. Never share the rule.
        std::string name = base;
        for (size_t n = 2; used_rule_names_.contains(name); ++n)
            name = std::format("{}_{}", base, n);
        used_rule_names_.insert(name);
        rule_names_.emplace(signature, name);

        rules_ += std::format("rule {}\n", name);
        rules_ += std::format("  command = {}\n", command);
        if (invocation.rule_name.empty())
            rules_ += std::format("  description = {} $out\n", upper(invocation.tool));
        if (!invocation.depfile.empty())
            rules_ += std::format("  depfile = {}\n", invocation.depfile);
        if (!invocation.deps_style.empty())
            rules_ += std::format("  deps = {}\n", invocation.deps_style);
        rules_ += "\n";
        return name;
    }

    void write_build(const BuildInvocation &invocation) {
        std::string rule = rule_for(invocation);

        std::vector<Node *> implicit = invocation.implicit_inputs;
        std::vector<Node *> order_only = invocation.order_only_inputs;
        for (auto *out : invocation.outputs) {
            for (auto *dep : out->explicit_deps())
                implicit.push_back(dep);
            for (auto *dep : out->implicit_deps())
                implicit.push_back(dep);
            for (auto *dep : out->order_only_deps())
                order_only.push_back(dep);
        }

        std::set<std::string> seen;
        std::string line = std::format("build{}: {}", paths(invocation.outputs), rule);
        line += paths(invocation.inputs, &seen);
        if (auto imp = paths(implicit, &seen); !imp.empty())
            line += " |" + imp;
        if (auto oo = paths(order_only, &seen); !oo.empty())
            line += " ||" + oo;
        builds_ += line + "\n";

        for (const auto &[name, tokens] : invocation.variables) {
            if (!tokens.empty())
                builds_ += std::format("  {} = {}\n", name, render_variable(tokens, output_dir_));
        }
        if (!invocation.description.empty())
            builds_ += std::format("  description = {}\n", escape_dollars(invocation.description));
        builds_ += "\n";

        for (const auto *out : invocation.outputs) {
            for (const auto &path : input_paths(*out, output_dir_))
                outputs_.insert(path);
        }
    }

    void write_directories() {
        for (const auto &owned : project_.nodes().nodes()) {
            const auto *dir = dynamic_cast<const DirNode *>(owned.get());
            if (!dir || dir->role() != DirRole::Target || dir->producer())
                continue;
            std::string path = relative_path(dir->path(), output_dir_);
            builds_ += std::format("build {}: phony{}\n\n", escape_path(path), paths(dir->members()));
            outputs_.insert(path);
        }
    }

    void write_aliases() {
        for (const auto &decl : project_.aliases()) {
            builds_ += std::format("build {}: phony{}\n\n", escape_path(decl.node->name()),
                                   paths(decl.node->members()));
            outputs_.insert(decl.node->name());
        }
    }

    void write_target_phonies() {
        for (const auto &target : project_.targets()) {
            auto outputs = target->output_nodes();
            if (!outputs || outputs->empty() || outputs_.contains(target->name()))
                continue;
            std::vector<Node *> nodes(outputs->begin(), outputs->end());
            builds_ += std::format("build {}: phony{}\n\n", escape_path(target->name()), paths(nodes));
            outputs_.insert(target->name());
        }
    }

    void write_defaults() {
        std::vector<Node *> nodes;
        for (const auto &ref : project_.defaults()) {
            if (const auto *target = std::get_if<Target *>(&ref)) {
                if (auto outputs = (*target)->output_nodes())
                    nodes.insert(nodes.end(), outputs->begin(), outputs->end());
            } else {
                nodes.push_back(std::get<Node *>(ref));
            }
        }
        if (!nodes.empty())
            builds_ += std::format("default{}\n", paths(nodes));
    }

    const Project &project_;
    fs::path output_dir_;
    std::string rules_;
    std::string builds_;
    std::map<std::string, std::string> rule_names_;
    std::set<std::string> used_rule_names_;
    std::set<std::string> outputs_;
};

} // namespace

Result<std::string> NinjaGenerator::render(const Project &project, const fs::path &output_dir) const {
    if (!project.resolved())
        return fail(ErrorKind::Unresolved, "the project must be resolved before generating build files");
    return NinjaWriter(project, output_dir).render();
}

} // namespace trellis
