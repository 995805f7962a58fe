#pragma once

#include "common/config.hpp"
#include "common/project_types.hpp"
#include "graph/build_graph.hpp"
#include "graph/graph_synthesizer.hpp"
#include "parsers/cbp_document.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cbp {

// Result of one conversion: the model and everything derived from it.
// Plans and graph refer into project, so a Workspace is never copied.
struct Workspace {
    ProjectInfo project;
    std::string project_dir;                // Absolute directory the project paths are relative to
    std::string active_target;              // Empty when no target is buildable
    std::vector<TargetPlan> plans;          // Build order
    BuildGraph graph;

    Workspace() = default;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const TargetPlan* find_plan(const std::string& target_name) const;
    const TargetPlan* active_plan() const;
};

// Rendered artifact, relative to the output directory
struct GeneratedFile {
    std::string path;
    std::string content;
};

// parse -> model -> resolve -> synthesize. Every stage reports fatal
// problems by throwing a CbpError; warnings go to the Diagnostics.
class Pipeline {
public:
    Pipeline(const GeneratorOptions& options, Diagnostics& diag) : options_(options), diag_(diag) {}

    std::unique_ptr<Workspace> run_file(const std::string& cbp_path);

    // Convert a document held in memory; paths resolve against project_dir
    std::unique_ptr<Workspace> run_string(const std::string& content, const std::string& project_dir);

    std::unique_ptr<Workspace> run(const CbpDocument& doc, const std::string& project_dir);

    // Render every registered generator. Nothing is written.
    std::vector<GeneratedFile> render(const Workspace& workspace) const;

    // Write rendered files below output_dir (created if missing)
    static void write_files(const std::vector<GeneratedFile>& files, const std::string& output_dir);

    const GeneratorOptions& options() const { return options_; }

private:
    std::string select_active_target(const ProjectInfo& project) const;

    GeneratorOptions options_;
    Diagnostics& diag_;
};

} // namespace cbp
