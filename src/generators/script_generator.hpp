#pragma once

#include "common/generator.hpp"
#include <string>
#include <vector>

namespace cbp {

// Generator for the build wrapper script (build.bat / build.sh).
// The script puts the toolchain on PATH, runs the active target's
// pre-build steps, ninja, then the post-build steps.
class BuildScriptGenerator : public Generator {
public:
    BuildScriptGenerator() = default;

    std::vector<GeneratedFile> generate(const Workspace& workspace, const GeneratorOptions& options) override;

    std::string name() const override { return "script"; }

    std::string description() const override {
        return "Build script (build.bat on Windows, build.sh elsewhere) wrapping ninja";
    }

    static std::string script_name(ScriptFlavor flavor);

    static std::string render(const Workspace& workspace, const GeneratorOptions& options);

    // Pre/post-build command with $compiler, $options and $includes substituted
    static std::string expand_command(const std::string& command, const TargetPlan& plan);

private:
    static std::string render_batch(const Workspace& workspace, const GeneratorOptions& options);
    static std::string render_shell(const Workspace& workspace, const GeneratorOptions& options);
};

} // namespace cbp
