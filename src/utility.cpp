#include "trellis/utility.hpp"

#include <format>
#include <string>

namespace trellis {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DependencyCycle:
        return "dependency cycle";
    case ErrorKind::CircularReference:
        return "circular reference";
    case ErrorKind::MissingVariable:
        return "missing variable";
    case ErrorKind::Substitution:
        return "substitution error";
    case ErrorKind::MissingSource:
        return "missing source";
    case ErrorKind::ToolNotFound:
        return "tool not found";
    case ErrorKind::Builder:
        return "builder error";
    case ErrorKind::NodeConflict:
        return "node conflict";
    case ErrorKind::Unresolved:
        return "unresolved";
    case ErrorKind::Io:
        return "i/o error";
    }
    return "error";
}

bool has_origin(const Origin &origin) {
    return origin.file_name() != nullptr && origin.file_name()[0] != '\0';
}

std::string format_origin(const Origin &origin) {
    if (!has_origin(origin))
        return "<unknown>";
    return std::format("{}:{}", origin.file_name(), origin.line());
}

std::string Error::what() const {
    if (has_origin(origin))
        return std::format("{}: {}", format_origin(origin), message);
    return message;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace trellis
