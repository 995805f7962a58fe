#include "pch.h"
#include "clangd_generator.hpp"
#include "common/path_utils.hpp"
#include <yaml-cpp/yaml.h>

namespace cbp {

namespace {

constexpr const char* JUMP_TABLES_FLAG = "-mjump-tables-in-text";
constexpr const char* CXX_PATH_PATTERN = ".*\\.(cpp|CPP|C|cc|cxx|hpp|hh|hxx)";

void write_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& values) {
    if (values.empty()) return;
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& value : values) {
        out << value;
    }
    out << YAML::EndSeq;
}

} // namespace

std::vector<std::string> ClangdGenerator::add_flags(const TargetPlan& plan) {
    const ResolvedOptions& options = plan.options;
    std::vector<std::string> flags = options.profile.default_flags;

    for (const auto& dir : options.profile.include_paths()) {
        flags.push_back("-isystem" + to_unix_path(dir));
    }
    for (const auto& dir : options.include_dirs) {
        flags.push_back("-I" + dir);
    }
    for (const auto& entry : options.compiler_flags) {
        for (const auto& token : split_command_line(entry)) {
            if (token.rfind("-march=", 0) == 0 || token == JUMP_TABLES_FLAG) continue;
            flags.push_back(token);
        }
    }
    if (options.march.present()) {
        flags.push_back(options.march.base_flag());
    }
    return dedupe_preserving_order(flags);
}

std::vector<std::string> ClangdGenerator::remove_flags(const TargetPlan& plan) {
    std::vector<std::string> flags;
    if (plan.options.march.present()) {
        flags.push_back(plan.options.march.full_flag);
    }
    flags.push_back(JUMP_TABLES_FLAG);
    return flags;
}

std::string ClangdGenerator::render(const Workspace& workspace, const GeneratorOptions& options) {
    const TargetPlan* plan = workspace.active_plan();
    if (!plan && !workspace.plans.empty()) plan = &workspace.plans.front();

    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "CompileFlags" << YAML::Value << YAML::BeginMap;
    if (plan) {
        write_list(out, "Add", add_flags(*plan));
        write_list(out, "Remove", remove_flags(*plan));
    } else {
        write_list(out, "Remove", {JUMP_TABLES_FLAG});
    }
    out << YAML::EndMap << YAML::EndMap;

    bool has_cxx = plan && std::any_of(plan->sources.begin(), plan->sources.end(),
                                       [](const ClassifiedSource& s) { return s.kind == SourceKind::Cxx; });
    if (has_cxx) {
        out << YAML::BeginDoc << YAML::BeginMap;
        out << YAML::Key << "If" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "PathMatch" << YAML::Value << YAML::DoubleQuoted << CXX_PATH_PATTERN;
        out << YAML::EndMap;
        out << YAML::Key << "CompileFlags" << YAML::Value << YAML::BeginMap;
        write_list(out, "Add", {"-xc++"});
        write_list(out, "Remove", {"-xc"});
        out << YAML::EndMap << YAML::EndMap;
    }

    if (!options.header_insertion) {
        out << YAML::BeginDoc << YAML::BeginMap;
        out << YAML::Key << "Completion" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "HeaderInsertion" << YAML::Value << "Never";
        out << YAML::EndMap << YAML::EndMap;
    }

    if (!out.good()) {
        throw std::logic_error(".clangd emitter: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::vector<GeneratedFile> ClangdGenerator::generate(const Workspace& workspace, const GeneratorOptions& options) {
    GeneratedFile file;
    file.path = ".clangd";
    file.content = render(workspace, options);
    return {file};
}

REGISTER_GENERATOR(ClangdGenerator, "clangd");

} // namespace cbp
