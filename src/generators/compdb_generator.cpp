#include "pch.h"
#include "compdb_generator.hpp"
#include <nlohmann/json.hpp>

namespace cbp {

std::vector<const CompileCommand*> CompileDatabaseGenerator::select_entries(const Workspace& workspace) {
    std::vector<std::string> order;
    if (!workspace.active_target.empty()) {
        order.push_back(workspace.active_target);
    }
    for (const auto& target : workspace.project.targets) {
        if (target.name != workspace.active_target) order.push_back(target.name);
    }

    std::vector<const CompileCommand*> entries;
    std::set<std::string> covered;
    for (const auto& target_name : order) {
        for (const auto& command : workspace.graph.compile_commands()) {
            if (command.target != target_name) continue;
            if (!covered.insert(command.source).second) continue;
            entries.push_back(&command);
        }
    }
    return entries;
}

std::string CompileDatabaseGenerator::render(const Workspace& workspace) {
    auto compdb = nlohmann::json::array();

    for (const CompileCommand* command : select_entries(workspace)) {
        auto entry = nlohmann::json::object({
            {"directory", workspace.project_dir},
            {"arguments", command->arguments},
            {"file", command->source},
            {"output", command->object},
        });
        compdb.push_back(std::move(entry));
    }
    return compdb.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::vector<GeneratedFile> CompileDatabaseGenerator::generate(const Workspace& workspace,
                                                              const GeneratorOptions& /*options*/) {
    GeneratedFile file;
    file.path = "compile_commands.json";
    file.content = render(workspace);
    log::debug("compile_commands.json: " + std::to_string(select_entries(workspace).size()) + " entries");
    return {file};
}

REGISTER_GENERATOR(CompileDatabaseGenerator, "compdb");

} // namespace cbp
