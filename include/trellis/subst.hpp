#pragma once

#include "trellis/utility.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis {

/// A variable holds either command text or an ordered sequence of discrete tokens.
using Value = std::variant<std::string, std::vector<std::string>>;

/// Flat variable set; a `tool.var` key addresses the `var` entry of the `tool` scope.
using Variables = std::map<std::string, Value, std::less<>>;

/// Sequence values joined with single spaces.
std::string to_scalar(const Value &value);
/// Scalars become a one-element sequence (an empty scalar becomes an empty sequence).
std::vector<std::string> to_sequence(const Value &value);

/**
 * @brief Layered variable namespace used by the substitution engine.
 *
 * Holds unscoped (cross-tool) variables and named scopes (one per tool). A namespace may be layered on top of a
 * parent: lookups fall through to the parent when the key is not set locally. The parent must outlive the layer.
 */
class Namespace {
public:
    Namespace() = default;
    explicit Namespace(const Namespace *parent) : parent_(parent) {
    }

    void set(std::string_view key, Value value);
    void update(const Variables &variables);
    void set_scope(const std::string &scope, const Variables &variables);

    const Value *find(std::string_view key) const;
    bool contains(std::string_view key) const {
        return find(key) != nullptr;
    }

private:
    Variables vars_;
    std::map<std::string, Variables, std::less<>> scopes_;
    const Namespace *parent_ = nullptr;
};

/**
 * @brief Expands every variable reference in `tmpl` into a single string.
 *
 * `$$` yields a literal `$`. Sequence values are joined with single spaces. A template without references is
 * returned unchanged.
 */
Result<std::string> expand(std::string_view tmpl, const Namespace &ns, Origin origin = {});

/**
 * @brief Expands `tmpl` into discrete command tokens.
 *
 * The template is split on whitespace. A token consisting of exactly one reference to a sequence yields one token per
 * element, so elements containing spaces survive as single tokens for per-token quoting downstream.
 */
Result<std::vector<std::string>> expand_to_sequence(std::string_view tmpl, const Namespace &ns, Origin origin = {});

/// Quotes a single token for a POSIX shell, only when needed.
std::string quote_for_shell(std::string_view token);

/// `$` -> `$$`, the inverse of the escape rule.
std::string escape_dollars(std::string_view text);

} // namespace trellis
