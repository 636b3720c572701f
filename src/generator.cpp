#include "trellis/generator.hpp"

#include "trellis/project.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>

namespace fs = std::filesystem;

namespace trellis {

std::string relative_path(const fs::path &path, const fs::path &base) {
    fs::path rel = path.lexically_relative(base);
    if (rel.empty())
        return path.generic_string();
    return rel.generic_string();
}

std::string escape_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '$' || c == ' ' || c == ':')
            out.push_back('$');
        out.push_back(c);
    }
    return out;
}

fs::path value_file(const fs::path &output_dir, const ValueNode &node) {
    return output_dir / ".values" / node.name();
}

std::vector<std::string> input_paths(const Node &node, const fs::path &output_dir) {
    switch (node.kind()) {
    case NodeKind::File:
        return {relative_path(node_path(node), output_dir)};
    case NodeKind::Dir: {
        const auto &dir = static_cast<const DirNode &>(node);
        if (dir.role() == DirRole::Target)
            return {relative_path(dir.path(), output_dir)};
        std::vector<std::string> out;
        for (const auto *member : dir.members()) {
            auto paths = input_paths(*member, output_dir);
            out.insert(out.end(), paths.begin(), paths.end());
        }
        return out;
    }
    case NodeKind::Value:
        return {relative_path(value_file(output_dir, static_cast<const ValueNode &>(node)), output_dir)};
    case NodeKind::Alias:
        return {node.name()};
    }
    return {};
}

std::string render_token(const CommandToken &token, const fs::path &output_dir) {
    if (token.is_path)
        return token.prefix + relative_path(token.value, output_dir);
    return token.prefix + token.value;
}

Bindings bindings_for(const BuildInvocation &invocation, const fs::path &output_dir) {
    Bindings bindings;
    auto &in = bindings["in"];
    for (const auto *node : invocation.inputs) {
        auto paths = input_paths(*node, output_dir);
        in.insert(in.end(), paths.begin(), paths.end());
    }
    auto &out = bindings["out"];
    for (const auto *node : invocation.outputs) {
        auto paths = input_paths(*node, output_dir);
        out.insert(out.end(), paths.begin(), paths.end());
    }
    for (const auto &[name, tokens] : invocation.variables) {
        auto &values = bindings[name];
        for (const auto &token : tokens)
            values.push_back(render_token(token, output_dir));
    }
    return bindings;
}

namespace {

bool is_simple_varname_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // namespace

std::vector<std::string> evaluate_token(std::string_view token, const Bindings &bindings) {
    auto lookup = [&](std::string_view name) -> const std::vector<std::string> * {
        if (auto it = bindings.find(name); it != bindings.end())
            return &it->second;
        return nullptr;
    };

    // A lone reference keeps list structure.
    std::string_view whole;
    if (token.size() > 1 && token[0] == '$' && std::ranges::all_of(token.substr(1), is_simple_varname_char))
        whole = token.substr(1);
    else if (token.starts_with("${") && token.ends_with("}") && token.find('}') == token.size() - 1)
        whole = token.substr(2, token.size() - 3);
    if (!whole.empty()) {
        if (const auto *values = lookup(whole))
            return *values;
        return {};
    }

    std::string out;
    for (size_t i = 0; i < token.size();) {
        if (token[i] != '$' || i + 1 >= token.size()) {
            out.push_back(token[i++]);
            continue;
        }
        if (token[i + 1] == '$') {
            out.push_back('$');
            i += 2;
            continue;
        }

        std::string_view name;
        if (token[i + 1] == '{') {
            size_t close = token.find('}', i + 2);
            if (close == std::string_view::npos) {
                out.append(token.substr(i));
                break;
            }
            name = token.substr(i + 2, close - i - 2);
            i = close + 1;
        } else {
            size_t end = i + 1;
            while (end < token.size() && is_simple_varname_char(token[end]))
                ++end;
            name = token.substr(i + 1, end - i - 1);
            i = end;
        }
        if (const auto *values = lookup(name))
            out.append(join(*values, " "));
    }
    return {out};
}

Result<void> write_file_atomic(const fs::path &path, std::string_view content) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
            return fail(ErrorKind::Io, std::format("cannot open {} for writing", tmp.string()));
        f.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!f)
            return fail(ErrorKind::Io, std::format("failed to write {}", tmp.string()));
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return fail(ErrorKind::Io, std::format("failed to move {} into place", path.string()));
    }
    return {};
}

namespace {

Result<void> write_values(const Project &project, const fs::path &output_dir) {
    for (const auto &owned : project.nodes().nodes()) {
        const auto *value = dynamic_cast<const ValueNode *>(owned.get());
        if (!value)
            continue;

        fs::path path = value_file(output_dir, *value);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            std::ifstream f(path, std::ios::binary);
            std::string current((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            if (current == value->value())
                continue;
        }

        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ErrorKind::Io,
                        std::format("failed to create {}: {}", path.parent_path().string(), ec.message()));
        }
        if (auto res = write_file_atomic(path, value->value()); !res)
            return res;
    }
    return {};
}

} // namespace

Result<void> generate(const Project &project, const fs::path &output_dir, const GeneratorConfig &config) {
    if (!project.resolved())
        return fail(ErrorKind::Unresolved, "the project must be resolved before generating build files");

    fs::path out_dir = project.nodes().canonical(output_dir);

    std::vector<std::unique_ptr<Generator>> generators;
    generators.push_back(std::make_unique<NinjaGenerator>(config.build_file));
    if (config.compile_commands)
        generators.push_back(std::make_unique<CompileCommandsGenerator>());
    if (config.mermaid)
        generators.push_back(std::make_unique<MermaidGenerator>(config.mermaid_file));

    std::vector<std::pair<fs::path, std::string>> files;
    for (const auto &generator : generators) {
        auto content = generator->render(project, out_dir);
        if (!content)
            return std::unexpected(content.error());
        files.emplace_back(out_dir / generator->file_name(), std::move(*content));
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec)
        return fail(ErrorKind::Io, std::format("failed to create {}: {}", out_dir.string(), ec.message()));

    if (auto res = write_values(project, out_dir); !res)
        return res;
    for (const auto &[path, content] : files) {
        if (auto res = write_file_atomic(path, content); !res)
            return res;
    }
    return {};
}

} // namespace trellis
