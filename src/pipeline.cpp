#include "pch.h"
#include "pipeline.hpp"
#include "common/generator.hpp"
#include "common/toolchain_registry.hpp"
#include "parsers/project_model_builder.hpp"
#include "resolvers/compiler_flags.hpp"
#include "resolvers/library_resolver.hpp"
#include "resolvers/object_mapper.hpp"

namespace fs = std::filesystem;

namespace cbp {

const TargetPlan* Workspace::find_plan(const std::string& target_name) const {
    for (const auto& plan : plans) {
        if (plan.target->name == target_name) return &plan;
    }
    return nullptr;
}

const TargetPlan* Workspace::active_plan() const {
    return active_target.empty() ? nullptr : find_plan(active_target);
}

std::unique_ptr<Workspace> Pipeline::run_file(const std::string& cbp_path) {
    CbpDocumentParser parser(diag_);
    CbpDocument doc = parser.parse(cbp_path);

    fs::path dir = fs::absolute(fs::path(cbp_path)).parent_path();
    return run(doc, dir.lexically_normal().string());
}

std::unique_ptr<Workspace> Pipeline::run_string(const std::string& content, const std::string& project_dir) {
    CbpDocumentParser parser(diag_);
    CbpDocument doc = parser.parse_string(content);
    return run(doc, project_dir);
}

std::string Pipeline::select_active_target(const ProjectInfo& project) const {
    if (options_.active_target) {
        const Target* target = project.find_target(*options_.active_target);
        if (!target) {
            throw SemanticModelError("Unknown target '" + *options_.active_target + "'");
        }
        if (!target->is_buildable()) {
            throw SemanticModelError("Target '" + target->name + "' runs commands only and cannot be built");
        }
        return target->name;
    }

    for (const auto& target : project.targets) {
        if (target.is_buildable()) return target.name;
    }
    diag_.warn("Project '" + project.title + "' has no buildable target");
    return "";
}

std::unique_ptr<Workspace> Pipeline::run(const CbpDocument& doc, const std::string& project_dir) {
    auto workspace = std::make_unique<Workspace>();
    workspace->project_dir = project_dir;

    ProjectModelBuilder builder(diag_);
    workspace->project = builder.build(doc);
    const ProjectInfo& project = workspace->project;

    workspace->active_target = select_active_target(project);
    log::debug("active target: " + (workspace->active_target.empty() ? std::string("<none>")
                                                                       : workspace->active_target));

    CompilerFlagAnalyzer analyzer(diag_);
    LibraryResolver resolver(project, project_dir, options_.linker_type, diag_);
    ObjectMapper mapper(diag_);
    auto& registry = ToolchainRegistry::instance();

    std::map<std::string, TargetPlan> by_name;
    std::map<std::string, LinkPlan> links;
    for (const auto& target : project.targets) {
        TargetPlan plan;
        plan.target = &target;
        plan.options = analyzer.analyze(target);

        if (target.is_buildable()) {
            plan.tools = registry.resolve_tools(plan.options.profile, diag_);
            plan.link = resolver.resolve(target, plan.options.profile);
            plan.sources = mapper.map_target(target, project.sources);
        }

        links[target.name] = plan.link;
        by_name[target.name] = std::move(plan);
    }

    for (const Target* target : resolver.build_order(links)) {
        workspace->plans.push_back(std::move(by_name[target->name]));
    }

    GraphSynthesizer synthesizer(project, diag_);
    workspace->graph = synthesizer.synthesize(workspace->plans, workspace->active_target);
    return workspace;
}

std::vector<GeneratedFile> Pipeline::render(const Workspace& workspace) const {
    std::vector<GeneratedFile> files;
    std::set<std::string> paths;

    auto& factory = GeneratorFactory::instance();
    for (const auto& name : factory.available_generators()) {
        auto generator = factory.create(name);
        if (!generator) continue;

        log::debug("rendering " + generator->name());
        for (auto& file : generator->generate(workspace, options_)) {
            if (!paths.insert(file.path).second) {
                throw std::logic_error("Generator '" + name + "' produced '" + file.path + "' twice");
            }
            files.push_back(std::move(file));
        }
    }
    return files;
}

void Pipeline::write_files(const std::vector<GeneratedFile>& files, const std::string& output_dir) {
    fs::path dir(output_dir);
    if (!dir.empty() && !fs::exists(dir)) {
        fs::create_directories(dir);
    }

    for (const auto& file : files) {
        fs::path path = dir / file.path;
        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
        out << file.content;
        if (!out) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
        out.close();

        if (path.extension() == ".sh") {
            std::error_code ec;
            fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                            fs::perm_options::add, ec);
            if (ec) {
                std::cerr << "Warning: Could not make " << path.string() << " executable: " << ec.message() << "\n";
            }
        }
        std::cout << "  Generated: " << path.string() << "\n";
    }
}

} // namespace cbp
