#pragma once

#include "common/project_types.hpp"
#include "common/toolchain_registry.hpp"
#include "graph/build_graph.hpp"
#include "resolvers/compiler_flags.hpp"
#include "resolvers/library_resolver.hpp"
#include "resolvers/object_mapper.hpp"
#include <string>
#include <vector>

namespace cbp {

// Everything resolved for one target before the graph is assembled
struct TargetPlan {
    const Target* target = nullptr;
    ResolvedOptions options;
    ToolSet tools;
    LinkPlan link;
    std::vector<ClassifiedSource> sources;
};

// Output named by a custom build command ("-o <file>" or "-o<file>"),
// or the fallback when the command names none
std::string custom_build_output(const std::string& command, const std::string& fallback);

// Escape text for use inside a rule command ('$' -> "$$")
std::string escape_command_text(const std::string& text);

// Rule-name-safe token built from arbitrary text
std::string sanitize_rule_token(const std::string& text);

class GraphSynthesizer {
public:
    GraphSynthesizer(const ProjectInfo& project, Diagnostics& diag) : project_(project), diag_(diag) {}

    // Assemble the build graph. Plans must be in build order (library
    // producers first). The active target's output becomes the default.
    BuildGraph synthesize(const std::vector<TargetPlan>& plans, const std::string& active_target);

private:
    struct TargetOutputs {
        std::vector<std::string> linked;        // Objects passed to the linker or archiver
        std::vector<std::string> built_only;    // Built with the target but not linked
        bool uses_cxx = false;
    };

    void add_compile_rules(BuildGraph& graph, const TargetPlan& plan);

    void add_compile_statement(BuildGraph& graph, const TargetPlan& plan,
                               const ClassifiedSource& entry, TargetOutputs& outputs);

    void add_special_statement(BuildGraph& graph, const TargetPlan& plan,
                               const ClassifiedSource& entry, TargetOutputs& outputs);

    void add_link_statement(BuildGraph& graph, const TargetPlan& plan, const TargetOutputs& outputs);

    // Command text of a custom build with CB variables and placeholders substituted
    std::string expand_custom_command(const TargetPlan& plan, const ClassifiedSource& entry) const;

    const ProjectInfo& project_;
    Diagnostics& diag_;
};

} // namespace cbp
