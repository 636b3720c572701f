#include "trellis/generator.hpp"
#include "trellis/project.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace trellis {

Result<std::string> CompileCommandsGenerator::render(const Project &project,
                                                     const std::filesystem::path &output_dir) const {
    if (!project.resolved())
        return fail(ErrorKind::Unresolved, "the project must be resolved before generating build files");

    using json = nlohmann::json;
    json compdb = json::array();

    for (const auto &invocation : project.invocations()) {
        // Only compilation steps: a language and a single source.
        if (invocation->language.empty() || invocation->inputs.size() != 1 || invocation->outputs.empty())
            continue;

        Bindings bindings = bindings_for(*invocation, output_dir);
        const auto &inputs = bindings["in"];
        if (inputs.empty())
            continue;

        std::vector<std::string> args;
        for (const auto &token : invocation->command) {
            for (auto &arg : evaluate_token(token, bindings)) {
                if (!arg.empty())
                    args.push_back(std::move(arg));
            }
        }

        json entry;
        entry["directory"] = output_dir.string();
        entry["file"] = inputs.front();
        entry["arguments"] = args;
        entry["output"] = bindings["out"].front();
        compdb.push_back(entry);
    }

    return compdb.dump(4) + "\n";
}

} // namespace trellis
