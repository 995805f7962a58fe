#pragma once

#include "common/generator.hpp"
#include <string>
#include <vector>

namespace cbp {

// Generator for compile_commands.json
class CompileDatabaseGenerator : public Generator {
public:
    CompileDatabaseGenerator() = default;

    std::vector<GeneratedFile> generate(const Workspace& workspace, const GeneratorOptions& options) override;

    std::string name() const override { return "compdb"; }

    std::string description() const override {
        return "Compilation database (compile_commands.json) for clangd and other tools";
    }

    // One entry per compiled source. A source built by several targets is
    // described by the active target, then by the first target in document order.
    static std::vector<const CompileCommand*> select_entries(const Workspace& workspace);

    static std::string render(const Workspace& workspace);
};

} // namespace cbp
