#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace trellis {

/// Flags whose argument is the following token (`-isystem dir`); the pair is deduplicated as one unit.
using SeparatedArgs = std::set<std::string, std::less<>>;

/// Appends the elements of `from` not already in `into`, preserving first-seen order.
void merge_unique(std::vector<std::string> &into, const std::vector<std::string> &from);
void merge_unique(std::vector<std::filesystem::path> &into, const std::vector<std::filesystem::path> &from);

/// Like `merge_unique`, but a separated-argument flag and its argument are compared and kept together.
void merge_flags(std::vector<std::string> &into, const std::vector<std::string> &from,
                 const SeparatedArgs &separated);

/**
 * @brief Build requirements a target imposes on its own sources or on its dependents.
 *
 * Every list is ordered and free of duplicates after a merge. Relative directories are taken relative to the project
 * root.
 */
struct UsageRequirements {
    std::vector<std::filesystem::path> include_dirs;
    std::vector<std::string> defines;
    std::vector<std::string> compile_flags;
    std::vector<std::string> link_flags;
    std::vector<std::string> link_libs;
    std::vector<std::filesystem::path> link_dirs;

    void merge(const UsageRequirements &other, const SeparatedArgs &separated = {});
    /// Only the link_* lists.
    void merge_link(const UsageRequirements &other, const SeparatedArgs &separated = {});

    bool empty() const;
    bool operator==(const UsageRequirements &) const = default;
};

} // namespace trellis
