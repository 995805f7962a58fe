#pragma once

#include "common/generator.hpp"
#include <string>
#include <vector>

namespace cbp {

// Generator for the clangd configuration file (.clangd)
class ClangdGenerator : public Generator {
public:
    ClangdGenerator() = default;

    std::vector<GeneratedFile> generate(const Workspace& workspace, const GeneratorOptions& options) override;

    std::string name() const override { return "clangd"; }

    std::string description() const override {
        return "clangd configuration (.clangd) with toolchain flags and headers";
    }

    // Flags clangd adds to every compile command of the project
    static std::vector<std::string> add_flags(const TargetPlan& plan);

    // Flags clangd strips because it cannot parse them
    static std::vector<std::string> remove_flags(const TargetPlan& plan);

    static std::string render(const Workspace& workspace, const GeneratorOptions& options);
};

} // namespace cbp
