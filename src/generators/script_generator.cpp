#include "pch.h"
#include "script_generator.hpp"
#include "common/path_utils.hpp"

namespace fs = std::filesystem;

namespace cbp {

namespace {

constexpr const char* DEFAULT_NINJA = "ninja";
constexpr const char* NINJA_FILE = "build.ninja";

std::string join(const std::vector<std::string>& values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += " ";
        result += values[i];
    }
    return result;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// True when artifacts are written next to the project file
bool writes_to_project_dir(const Workspace& workspace, const GeneratorOptions& options) {
    if (options.output_dir.empty()) return true;
    fs::path out = fs::absolute(options.output_dir).lexically_normal();
    fs::path project = fs::path(workspace.project_dir).lexically_normal();
    return strip_trailing_separators(out.string()) == strip_trailing_separators(project.string());
}

std::string ninja_file_argument(const Workspace& workspace, const GeneratorOptions& options) {
    if (writes_to_project_dir(workspace, options)) return NINJA_FILE;
    return quote_argument((fs::absolute(options.output_dir).lexically_normal() / NINJA_FILE).string());
}

} // namespace

std::string BuildScriptGenerator::script_name(ScriptFlavor flavor) {
    return flavor == ScriptFlavor::Batch ? "build.bat" : "build.sh";
}

std::string BuildScriptGenerator::expand_command(const std::string& command, const TargetPlan& plan) {
    std::vector<std::string> includes;
    for (const auto& dir : plan.options.include_dirs) {
        includes.push_back(quote_argument("-I" + dir));
    }

    std::string result = command;
    replace_all(result, "$compiler", quote_argument(plan.tools.cc));
    replace_all(result, "$options", join(plan.options.compiler_flags));
    replace_all(result, "$includes", join(includes));
    return result;
}

std::string BuildScriptGenerator::render_batch(const Workspace& workspace, const GeneratorOptions& options) {
    const TargetPlan* plan = workspace.active_plan();
    std::ostringstream out;

    out << "@echo off\n";
    out << "rem Generated by cbpgen\n\n";

    if (writes_to_project_dir(workspace, options)) {
        out << "cd /d \"%~dp0\"\n\n";
    } else {
        out << "cd /d \"" << workspace.project_dir << "\"\n\n";
    }

    if (plan && plan->options.profile.is_known()) {
        out << "rem Set toolchain path\n";
        out << "set \"PATH=" << plan->options.profile.bin_dir() << ";%PATH%\"\n\n";
    }

    if (plan && !plan->target->commands.before.empty()) {
        out << "rem Prebuild commands\n";
        for (const auto& command : plan->target->commands.before) {
            out << "call " << expand_command(command, *plan) << "\n";
            out << "if %errorlevel% neq 0 exit /b %errorlevel%\n";
        }
        out << "\n";
    }

    out << "rem Build project with ninja\n";
    out << quote_argument(options.ninja_path.value_or(DEFAULT_NINJA)) << " -f "
        << ninja_file_argument(workspace, options) << "\n";
    out << "if %errorlevel% neq 0 exit /b %errorlevel%\n\n";

    if (plan && !plan->target->commands.after.empty()) {
        out << "rem Postbuild commands\n";
        for (const auto& command : plan->target->commands.after) {
            out << "call " << expand_command(command, *plan) << "\n";
            out << "if %errorlevel% neq 0 exit /b %errorlevel%\n";
        }
        out << "\n";
    }

    out << "echo Build completed successfully\n";
    return out.str();
}

std::string BuildScriptGenerator::render_shell(const Workspace& workspace, const GeneratorOptions& options) {
    const TargetPlan* plan = workspace.active_plan();
    std::ostringstream out;

    out << "#!/bin/sh\n";
    out << "# Generated by cbpgen\n";
    out << "set -e\n\n";

    if (writes_to_project_dir(workspace, options)) {
        out << "cd \"$(dirname \"$0\")\"\n\n";
    } else {
        out << "cd \"" << to_unix_path(workspace.project_dir) << "\"\n\n";
    }

    if (plan && plan->options.profile.is_known()) {
        out << "# Set toolchain path\n";
        out << "export PATH=\"" << to_unix_path(plan->options.profile.bin_dir()) << ":$PATH\"\n\n";
    }

    if (plan && !plan->target->commands.before.empty()) {
        out << "# Prebuild commands\n";
        for (const auto& command : plan->target->commands.before) {
            out << expand_command(command, *plan) << "\n";
        }
        out << "\n";
    }

    out << "# Build project with ninja\n";
    out << quote_argument(options.ninja_path.value_or(DEFAULT_NINJA)) << " -f "
        << ninja_file_argument(workspace, options) << "\n\n";

    if (plan && !plan->target->commands.after.empty()) {
        out << "# Postbuild commands\n";
        for (const auto& command : plan->target->commands.after) {
            out << expand_command(command, *plan) << "\n";
        }
        out << "\n";
    }

    out << "echo \"Build completed successfully\"\n";
    return out.str();
}

std::string BuildScriptGenerator::render(const Workspace& workspace, const GeneratorOptions& options) {
    return options.script_flavor == ScriptFlavor::Batch ? render_batch(workspace, options)
                                                        : render_shell(workspace, options);
}

std::vector<GeneratedFile> BuildScriptGenerator::generate(const Workspace& workspace, const GeneratorOptions& options) {
    GeneratedFile file;
    file.path = script_name(options.script_flavor);
    file.content = render(workspace, options);
    return {file};
}

REGISTER_GENERATOR(BuildScriptGenerator, "script");

} // namespace cbp
