#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace cbp {

// Target types as stored in <Option type="N"/>
enum class TargetType {
    GuiApplication = 0,
    ConsoleApplication = 1,
    StaticLibrary = 2,
    DynamicLibrary = 3,
    CommandsOnly = 4
};

// How target-level values combine with project-level values
// (projectCompilerOptionsRelation and friends)
enum class OptionsRelation {
    ProjectOnly = 0,   // Ignore target values
    TargetOnly = 1,    // Ignore project values
    TargetFirst = 2,   // Target values, then project values
    ProjectFirst = 3   // Project values, then target values (Code::Blocks default)
};

// Custom build command attached to a unit for one compiler
struct CustomBuild {
    std::string compiler_id;
    std::string command;
};

// Pre/post build steps (<ExtraCommands>)
struct BuildCommands {
    std::vector<std::string> before;
    std::vector<std::string> after;
};

// Source file entry (<Unit filename="...">)
struct SourceFile {
    std::string path;                             // Project-relative, forward slashes
    std::vector<std::string> targets;             // Empty means "all targets"
    bool compile = true;
    bool link = true;
    std::vector<std::string> compiler_options;    // Per-file overrides
    std::vector<std::string> include_dirs;        // Per-file include directories
    std::vector<CustomBuild> custom_builds;

    bool applies_to(const std::string& target_name) const {
        return targets.empty() ||
               std::find(targets.begin(), targets.end(), target_name) != targets.end();
    }
};

// Build target (<Build><Target title="...">), fully merged with project scope
struct Target {
    std::string name;
    TargetType type = TargetType::ConsoleApplication;
    std::string output;                           // Resolved output file
    std::string object_output;                    // Resolved intermediate directory, no trailing slash
    std::string working_dir;
    std::string compiler_id;

    std::vector<std::string> compiler_options;    // Project and target flags, relation applied
    std::vector<std::string> include_dirs;
    std::vector<std::string> linker_options;
    std::vector<std::string> library_dirs;

    // Library references by origin, in document order
    std::vector<std::string> project_libraries;
    std::vector<std::string> target_libraries;

    std::vector<std::string> external_deps;
    BuildCommands commands;

    bool is_static_library() const { return type == TargetType::StaticLibrary; }
    bool is_dynamic_library() const { return type == TargetType::DynamicLibrary; }
    bool is_buildable() const { return type != TargetType::CommandsOnly; }
};

// Project (<CodeBlocks_project_file><Project>)
struct ProjectInfo {
    std::string title;
    std::string compiler_id;                      // Project-level compiler, may be empty

    // Project-scope settings, kept for reference after merging into targets
    std::vector<std::string> compiler_options;
    std::vector<std::string> include_dirs;
    std::vector<std::string> linker_options;
    std::vector<std::string> library_dirs;
    std::vector<std::string> linker_libraries;
    BuildCommands commands;

    std::vector<Target> targets;                  // Document order
    std::vector<SourceFile> sources;              // Document order

    const Target* find_target(const std::string& name) const {
        for (const auto& target : targets) {
            if (target.name == name) return &target;
        }
        return nullptr;
    }
};

inline const char* target_type_to_string(TargetType type) {
    switch (type) {
        case TargetType::GuiApplication: return "GUI application";
        case TargetType::ConsoleApplication: return "console application";
        case TargetType::StaticLibrary: return "static library";
        case TargetType::DynamicLibrary: return "dynamic library";
        case TargetType::CommandsOnly: return "commands only";
        default: return "unknown";
    }
}

} // namespace cbp
