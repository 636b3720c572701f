#include "trellis/subst.hpp"

#include "trellis/utility.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

std::string to_scalar(const Value &value) {
    if (const auto *s = std::get_if<std::string>(&value))
        return *s;
    return join(std::get<std::vector<std::string>>(value), " ");
}

std::vector<std::string> to_sequence(const Value &value) {
    if (const auto *s = std::get_if<std::string>(&value)) {
        if (s->empty())
            return {};
        return {*s};
    }
    return std::get<std::vector<std::string>>(value);
}

void Namespace::set(std::string_view key, Value value) {
    if (auto dot = key.find('.'); dot != std::string_view::npos) {
        scopes_[std::string(key.substr(0, dot))].insert_or_assign(std::string(key.substr(dot + 1)), std::move(value));
        return;
    }
    vars_.insert_or_assign(std::string(key), std::move(value));
}

void Namespace::update(const Variables &variables) {
    for (const auto &[key, value] : variables)
        set(key, value);
}

void Namespace::set_scope(const std::string &scope, const Variables &variables) {
    auto &target = scopes_[scope];
    for (const auto &[key, value] : variables)
        target.insert_or_assign(key, value);
}

const Value *Namespace::find(std::string_view key) const {
    if (auto dot = key.find('.'); dot != std::string_view::npos) {
        if (auto scope = scopes_.find(key.substr(0, dot)); scope != scopes_.end()) {
            if (auto it = scope->second.find(key.substr(dot + 1)); it != scope->second.end())
                return &it->second;
        }
    } else if (auto it = vars_.find(key); it != vars_.end()) {
        return &it->second;
    }
    return parent_ ? parent_->find(key) : nullptr;
}

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool is_identifier(std::string_view s, bool allow_dots) {
    if (s.empty() || !is_ident_start(s[0]))
        return false;
    return std::ranges::all_of(s.substr(1), [&](char c) { return is_ident_char(c) && (allow_dots || c != '.'); });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        size_t start = i;
        size_t braced = 0; // whitespace inside ${...} belongs to the reference
        while (i < text.size() && (braced > 0 || !std::isspace(static_cast<unsigned char>(text[i])))) {
            if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '$') {
                i += 2;
                continue;
            }
            if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{') {
                ++braced;
                i += 2;
                continue;
            }
            if (braced && text[i] == '}')
                --braced;
            ++i;
        }
        if (i > start)
            out.push_back(text.substr(start, i - start));
    }
    return out;
}

struct Reference {
    enum class Kind { Escape, Variable, Function, Literal } kind;
    std::string_view name;
    std::string_view args;
    size_t end; // one past the reference
};

class Expander {
public:
    Expander(const Namespace &ns, Origin origin) : ns_(ns), origin_(origin) {
    }

    Result<std::string> scalar(std::string_view text) {
        std::string out;
        size_t i = 0;
        while (i < text.size()) {
            size_t dollar = text.find('$', i);
            if (dollar == std::string_view::npos) {
                out.append(text.substr(i));
                break;
            }
            out.append(text.substr(i, dollar - i));

            auto ref = parse_reference(text, dollar);
            if (!ref)
                return std::unexpected(ref.error());

            switch (ref->kind) {
            case Reference::Kind::Escape:
            case Reference::Kind::Literal:
                out.push_back('$');
                break;
            case Reference::Kind::Variable: {
                auto value = variable_scalar(ref->name);
                if (!value)
                    return std::unexpected(value.error());
                out.append(*value);
                break;
            }
            case Reference::Kind::Function: {
                auto tokens = call(ref->name, ref->args);
                if (!tokens)
                    return std::unexpected(tokens.error());
                out.append(join(*tokens, " "));
                break;
            }
            }
            i = ref->end;
        }
        return out;
    }

    Result<std::vector<std::string>> sequence(std::string_view text) {
        std::vector<std::string> out;
        for (auto token : split_whitespace(text)) {
            if (auto res = append_token(token, out); !res)
                return std::unexpected(res.error());
        }
        return out;
    }

private:
    Result<void> append_token(std::string_view token, std::vector<std::string> &out) {
        if (token.front() == '$') {
            auto ref = parse_reference(token, 0);
            if (!ref)
                return std::unexpected(ref.error());
            if (ref->end == token.size() && ref->kind == Reference::Kind::Variable) {
                const Value *value = nullptr;
                if (auto res = enter(ref->name, value); !res)
                    return res;

                if (const auto *items = std::get_if<std::vector<std::string>>(value)) {
                    for (const auto &item : *items) {
                        auto expanded = scalar(item);
                        if (!expanded)
                            return leave_with(expanded.error());
                        out.push_back(std::move(*expanded));
                    }
                } else {
                    auto expanded = sequence(std::get<std::string>(*value));
                    if (!expanded)
                        return leave_with(expanded.error());
                    out.insert(out.end(), expanded->begin(), expanded->end());
                }
                stack_.pop_back();
                return {};
            }
            if (ref->end == token.size() && ref->kind == Reference::Kind::Function) {
                auto tokens = call(ref->name, ref->args);
                if (!tokens)
                    return std::unexpected(tokens.error());
                out.insert(out.end(), tokens->begin(), tokens->end());
                return {};
            }
        }

        auto expanded = scalar(token);
        if (!expanded)
            return std::unexpected(expanded.error());
        out.push_back(std::move(*expanded));
        return {};
    }

    Result<Reference> parse_reference(std::string_view text, size_t pos) {
        size_t next = pos + 1;
        if (next >= text.size())
            return Reference{Reference::Kind::Literal, {}, {}, next};

        if (text[next] == '$')
            return Reference{Reference::Kind::Escape, {}, {}, next + 1};

        if (text[next] == '{') {
            size_t close = std::string_view::npos;
            for (size_t j = next + 1, depth = 1; j < text.size(); ++j) {
                if (text[j] == '{') {
                    ++depth;
                } else if (text[j] == '}' && --depth == 0) {
                    close = j;
                    break;
                }
            }
            if (close == std::string_view::npos)
                return fail(ErrorKind::Substitution, std::format("unterminated reference in '{}'", text), origin_);
            std::string_view inner = text.substr(next + 1, close - next - 1);

            if (auto paren = inner.find('('); paren != std::string_view::npos && inner.back() == ')') {
                std::string_view func = inner.substr(0, paren);
                if (!is_identifier(func, false))
                    return fail(ErrorKind::Substitution, std::format("malformed function call '${{{}}}'", inner),
                                origin_);
                return Reference{Reference::Kind::Function, func, inner.substr(paren + 1, inner.size() - paren - 2),
                                 close + 1};
            }
            if (!is_identifier(inner, true))
                return fail(ErrorKind::Substitution, std::format("malformed reference '${{{}}}'", inner), origin_);
            return Reference{Reference::Kind::Variable, inner, {}, close + 1};
        }

        if (!is_ident_start(text[next]))
            return Reference{Reference::Kind::Literal, {}, {}, next};

        size_t end = next;
        while (end < text.size() && is_ident_char(text[end]))
            ++end;
        // A trailing dot ends the sentence, not the name.
        while (text[end - 1] == '.')
            --end;
        return Reference{Reference::Kind::Variable, text.substr(next, end - next), {}, end};
    }

    // Pushes `name` on the expansion stack and looks it up. The caller pops on success.
    Result<void> enter(std::string_view name, const Value *&value) {
        if (auto it = std::ranges::find(stack_, name); it != stack_.end()) {
            std::vector<std::string> chain(it, stack_.end());
            chain.emplace_back(name);
            Error err{ErrorKind::CircularReference,
                      std::format("circular variable reference: {}", join(chain, " -> ")), origin_, chain};
            stack_.clear();
            return std::unexpected(std::move(err));
        }
        value = ns_.find(name);
        if (!value)
            return fail(ErrorKind::MissingVariable, std::format("undefined variable: ${}", name), origin_);
        stack_.emplace_back(name);
        return {};
    }

    std::unexpected<Error> leave_with(Error err) {
        if (!stack_.empty())
            stack_.pop_back();
        return std::unexpected(std::move(err));
    }

    Result<std::string> variable_scalar(std::string_view name) {
        const Value *value = nullptr;
        if (auto res = enter(name, value); !res)
            return std::unexpected(res.error());

        std::string out;
        if (const auto *items = std::get_if<std::vector<std::string>>(value)) {
            std::vector<std::string> parts;
            parts.reserve(items->size());
            for (const auto &item : *items) {
                auto expanded = scalar(item);
                if (!expanded)
                    return leave_with(expanded.error());
                parts.push_back(std::move(*expanded));
            }
            out = join(parts, " ");
        } else {
            auto expanded = scalar(std::get<std::string>(*value));
            if (!expanded)
                return leave_with(expanded.error());
            out = std::move(*expanded);
        }
        stack_.pop_back();
        return out;
    }

    Result<std::vector<std::string>> variable_items(std::string_view name) {
        const Value *value = nullptr;
        if (auto res = enter(name, value); !res)
            return std::unexpected(res.error());

        std::vector<std::string> out;
        for (const auto &item : to_sequence(*value)) {
            auto expanded = scalar(item);
            if (!expanded)
                return leave_with(expanded.error());
            out.push_back(std::move(*expanded));
        }
        stack_.pop_back();
        return out;
    }

    // Function arguments: `$var`, `${var}`, dotted names and defined simple names are references; anything else is
    // a literal.
    Result<std::vector<std::string>> argument(std::string_view arg) {
        if (arg.starts_with("${") && arg.ends_with("}"))
            return variable_items(arg.substr(2, arg.size() - 3));
        if (arg.starts_with("$"))
            return variable_items(arg.substr(1));
        if (is_identifier(arg, true) && arg.find('.') != std::string_view::npos)
            return variable_items(arg);
        if (is_identifier(arg, false) && ns_.contains(arg))
            return variable_items(arg);
        return std::vector<std::string>{std::string(arg)};
    }

    Result<std::string> argument_scalar(std::string_view arg) {
        auto items = argument(arg);
        if (!items)
            return std::unexpected(items.error());
        return join(*items, " ");
    }

    Result<std::vector<std::string>> call(std::string_view func, std::string_view args_text) {
        std::vector<std::string_view> args;
        size_t start = 0;
        while (start <= args_text.size()) {
            size_t comma = args_text.find(',', start);
            if (comma == std::string_view::npos)
                comma = args_text.size();
            if (auto arg = trim(args_text.substr(start, comma - start)); !arg.empty())
                args.push_back(arg);
            start = comma + 1;
        }

        auto arity = [&](size_t n) -> Result<void> {
            if (args.size() != n)
                return fail(ErrorKind::Substitution,
                            std::format("{}() requires {} args, got {}", func, n, args.size()), origin_);
            return {};
        };

        std::vector<std::string> out;
        if (func == "prefix" || func == "pairwise") {
            if (auto res = arity(2); !res)
                return std::unexpected(res.error());
            auto prefix = argument_scalar(args[0]);
            auto items = argument(args[1]);
            if (!prefix)
                return std::unexpected(prefix.error());
            if (!items)
                return std::unexpected(items.error());
            for (const auto &item : *items) {
                if (func == "prefix") {
                    out.push_back(*prefix + item);
                } else {
                    out.push_back(*prefix);
                    out.push_back(item);
                }
            }
        } else if (func == "suffix") {
            if (auto res = arity(2); !res)
                return std::unexpected(res.error());
            auto items = argument(args[0]);
            auto suffix = argument_scalar(args[1]);
            if (!items)
                return std::unexpected(items.error());
            if (!suffix)
                return std::unexpected(suffix.error());
            for (const auto &item : *items)
                out.push_back(item + *suffix);
        } else if (func == "wrap") {
            if (auto res = arity(3); !res)
                return std::unexpected(res.error());
            auto prefix = argument_scalar(args[0]);
            auto items = argument(args[1]);
            auto suffix = argument_scalar(args[2]);
            if (!prefix)
                return std::unexpected(prefix.error());
            if (!items)
                return std::unexpected(items.error());
            if (!suffix)
                return std::unexpected(suffix.error());
            for (const auto &item : *items)
                out.push_back(*prefix + item + *suffix);
        } else if (func == "join") {
            if (auto res = arity(2); !res)
                return std::unexpected(res.error());
            auto sep = argument_scalar(args[0]);
            auto items = argument(args[1]);
            if (!sep)
                return std::unexpected(sep.error());
            if (!items)
                return std::unexpected(items.error());
            out.push_back(join(*items, *sep));
        } else {
            return fail(ErrorKind::Substitution, std::format("unknown function: {}", func), origin_);
        }
        return out;
    }

    const Namespace &ns_;
    Origin origin_;
    std::vector<std::string> stack_;
};

} // namespace

Result<std::string> expand(std::string_view tmpl, const Namespace &ns, Origin origin) {
    return Expander(ns, origin).scalar(tmpl);
}

Result<std::vector<std::string>> expand_to_sequence(std::string_view tmpl, const Namespace &ns, Origin origin) {
    return Expander(ns, origin).sequence(tmpl);
}

std::string quote_for_shell(std::string_view token) {
    if (token.empty())
        return "''";

    constexpr std::string_view special = " \t\n\"'\\$`!*?[](){}|&;<>";
    if (token.find_first_of(special) == std::string_view::npos)
        return std::string(token);

    if (token.find('\'') == std::string_view::npos)
        return std::format("'{}'", token);

    std::string out = "\"";
    for (char c : token) {
        if (c == '\\' || c == '"' || c == '$' || c == '`')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string escape_dollars(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(c);
        if (c == '$')
            out.push_back('$');
    }
    return out;
}

} // namespace trellis
