#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

/// Declaration site of a node, target or environment in the calling program.
using Origin = std::source_location;

enum class ErrorKind {
    DependencyCycle,
    CircularReference,
    MissingVariable,
    Substitution,
    MissingSource,
    ToolNotFound,
    Builder,
    NodeConflict,
    Unresolved,
    Io,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Error value carried by every failed `Result`.
 *
 * Structural errors (cycles) fill `chain` with the names forming the cycle, first element repeated at the end.
 */
struct Error {
    ErrorKind kind;
    std::string message;
    Origin origin = {};
    std::vector<std::string> chain = {};

    /// `file:line: message`, or just the message when the origin is unknown.
    std::string what() const;
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message, Origin origin = {}) {
    return std::unexpected(Error{kind, std::move(message), origin});
}

bool has_origin(const Origin &origin);
std::string format_origin(const Origin &origin);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

} // namespace trellis
