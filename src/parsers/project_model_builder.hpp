#pragma once

#include "common/project_types.hpp"
#include "common/path_utils.hpp"
#include "parsers/cbp_document.hpp"
#include <string>
#include <vector>

namespace cbp {

// Placeholder table for one target: project and target names, directories
// and output file. Built once per target after its values are resolved.
MacroTable make_target_macros(const ProjectInfo& project, const Target& target);

// Converts a parsed document into a normalized ProjectInfo.
// Target values are merged with project values field by field: flags,
// include and library directories follow the target's options relation,
// output and object directories replace, libraries are collected per origin.
class ProjectModelBuilder {
public:
    explicit ProjectModelBuilder(Diagnostics& diag) : diag_(diag) {}

    ProjectInfo build(const CbpDocument& doc);

private:
    struct ScopeSettings {
        std::string compiler_id;
        std::vector<std::string> compiler_options;
        std::vector<std::string> include_dirs;
        std::vector<std::string> linker_options;
        std::vector<std::string> library_dirs;
        std::vector<std::string> libraries;
        BuildCommands commands;
    };

    // Read <Compiler>, <Linker> and <ExtraCommands> below a project or target
    ScopeSettings read_scope(const RawElement& element);

    Target build_target(const RawElement& element, const ProjectInfo& project,
                        const ScopeSettings& project_scope);

    SourceFile build_source(const RawElement& unit, const ProjectInfo& project);

    OptionsRelation read_relation(const RawElement& element, const std::string& key,
                                  const std::string& target_name);

    // Apply the target's placeholder table to every string it owns
    void expand_placeholders(Target& target, const ProjectInfo& project);

    std::string resolve_output(const RawElement& element, Target& target);

    Diagnostics& diag_;
};

// Combine project and target values according to a relation
std::vector<std::string> merge_by_relation(const std::vector<std::string>& project_values,
                                           const std::vector<std::string>& target_values,
                                           OptionsRelation relation);

} // namespace cbp
