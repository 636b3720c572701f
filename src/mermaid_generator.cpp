#include "trellis/generator.hpp"
#include "trellis/project.hpp"

#include <format>
#include <map>
#include <string>

namespace trellis {

namespace {

std::string label(const Target &target) {
    std::string out;
    for (char c : target.name()) {
        if (c == '"')
            out += "#quot;";
        else
            out.push_back(c);
    }
    return std::format("{} ({})", out, to_string(target.kind()));
}

} // namespace

Result<std::string> MermaidGenerator::render(const Project &project, const std::filesystem::path &) const {
    std::map<const Target *, size_t> ids;
    for (const auto &target : project.targets())
        ids.emplace(target.get(), ids.size());

    std::string out = "flowchart LR\n";
    for (const auto &target : project.targets())
        out += std::format("    t{}[\"{}\"]\n", ids[target.get()], label(*target));

    for (const auto &target : project.targets()) {
        size_t from = ids[target.get()];
        for (const auto &link : target->links()) {
            if (link.is_public)
                out += std::format("    t{} --> t{}\n", from, ids[link.target]);
            else
                out += std::format("    t{} -. private .-> t{}\n", from, ids[link.target]);
        }
        for (const auto *source : target->pending_sources())
            out += std::format("    t{} == sources ==> t{}\n", from, ids[source]);
    }
    return out;
}

} // namespace trellis
