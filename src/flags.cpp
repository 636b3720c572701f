#include "trellis/flags.hpp"

#include <algorithm>

namespace trellis {

namespace {

using Unit = std::vector<std::string>;

std::vector<Unit> group(const std::vector<std::string> &flags, const SeparatedArgs &separated) {
    std::vector<Unit> units;
    for (size_t i = 0; i < flags.size(); ++i) {
        if (separated.contains(flags[i]) && i + 1 < flags.size()) {
            units.push_back({flags[i], flags[i + 1]});
            ++i;
        } else {
            units.push_back({flags[i]});
        }
    }
    return units;
}

template <typename T> void append_missing(std::vector<T> &into, const std::vector<T> &from) {
    for (const auto &item : from) {
        if (std::ranges::find(into, item) == into.end())
            into.push_back(item);
    }
}

} // namespace

void merge_unique(std::vector<std::string> &into, const std::vector<std::string> &from) {
    append_missing(into, from);
}

void merge_unique(std::vector<std::filesystem::path> &into, const std::vector<std::filesystem::path> &from) {
    append_missing(into, from);
}

void merge_flags(std::vector<std::string> &into, const std::vector<std::string> &from,
                 const SeparatedArgs &separated) {
    if (separated.empty()) {
        merge_unique(into, from);
        return;
    }

    auto units = group(into, separated);
    for (auto &unit : group(from, separated)) {
        if (std::ranges::find(units, unit) == units.end())
            units.push_back(std::move(unit));
    }

    into.clear();
    for (const auto &unit : units)
        into.insert(into.end(), unit.begin(), unit.end());
}

void UsageRequirements::merge(const UsageRequirements &other, const SeparatedArgs &separated) {
    merge_unique(include_dirs, other.include_dirs);
    merge_unique(defines, other.defines);
    merge_flags(compile_flags, other.compile_flags, separated);
    merge_link(other, separated);
}

void UsageRequirements::merge_link(const UsageRequirements &other, const SeparatedArgs &separated) {
    merge_flags(link_flags, other.link_flags, separated);
    merge_unique(link_libs, other.link_libs);
    merge_unique(link_dirs, other.link_dirs);
}

bool UsageRequirements::empty() const {
    return include_dirs.empty() && defines.empty() && compile_flags.empty() && link_flags.empty() &&
           link_libs.empty() && link_dirs.empty();
}

} // namespace trellis
