#include "pch.h"
#include "pipeline.hpp"
#include "sample_project.hpp"
#include "common/generator.hpp"
#include "common/toolchain_registry.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* VERSION = "1.4.0";

void print_usage(const char* program_name) {
    std::cout << "cbpgen - Code::Blocks project to compile_commands.json, .clangd and build.ninja\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options] <project.cbp> [output_dir]\n";
    std::cout << "  " << program_name << " --test [options] [output_dir]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -l, --linker <type>       Linker invocation: gcc (default) or ld\n";
    std::cout << "  -n, --ninja <path>        Ninja executable used by the build script\n";
    std::cout << "  -t, --target <name>       Active target (default: first buildable target)\n";
    std::cout << "      --toolchain-root <d>  RV32 toolchain installation root\n";
    std::cout << "      --no-header-insertion Disable clangd header insertion\n";
    std::cout << "      --test                Convert the built-in sample project\n";
    std::cout << "      --debug               Print [DEBUG] trace output\n";
    std::cout << "  -v, --version             Show version\n";
    std::cout << "  -h, --help                Show this help message\n\n";
    std::cout << "Generated files:\n";
    auto& factory = cbp::GeneratorFactory::instance();
    for (const auto& name : factory.available_generators()) {
        auto gen = factory.create(name);
        if (gen) {
            std::cout << "  " << name << " - " << gen->description() << "\n";
        }
    }
    std::cout << "\nRelative output directories are resolved against the project file's directory.\n";
}

void report_warnings(const cbp::Diagnostics& diag) {
    for (const auto& warning : diag.warnings()) {
        std::cerr << "Warning: " << warning << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    cbp::GeneratorOptions options;
    std::string cbp_path;
    std::string output_arg;
    bool test_mode = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "cbpgen v" << VERSION << "\n";
            return 0;
        } else if (strcmp(argv[i], "--debug") == 0) {
            cbp::log::set_debug_mode(true);
        } else if (strcmp(argv[i], "--test") == 0) {
            test_mode = true;
        } else if (strcmp(argv[i], "--no-header-insertion") == 0) {
            options.header_insertion = false;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--linker") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires an argument\n";
                return 1;
            }
            auto type = cbp::parse_linker_type(argv[++i]);
            if (!type) {
                std::cerr << "Error: Invalid linker type '" << argv[i] << "' (expected gcc or ld)\n";
                return 1;
            }
            options.linker_type = *type;
        } else if (strcmp(argv[i], "-n") == 0 || strcmp(argv[i], "--ninja") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires an argument\n";
                return 1;
            }
            options.ninja_path = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--target") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires an argument\n";
                return 1;
            }
            options.active_target = argv[++i];
        } else if (strcmp(argv[i], "--toolchain-root") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires an argument\n";
                return 1;
            }
            cbp::ToolchainRegistry::instance().set_root(argv[++i]);
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (cbp_path.empty() && !test_mode) {
            cbp_path = argv[i];
        } else if (output_arg.empty()) {
            output_arg = argv[i];
        } else {
            std::cerr << "Error: Unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    // --test given after the project path: the path was the output directory
    if (test_mode && !cbp_path.empty()) {
        if (!output_arg.empty()) {
            std::cerr << "Error: Unexpected argument: " << output_arg << "\n";
            return 1;
        }
        output_arg = cbp_path;
        cbp_path.clear();
    }

    if (!test_mode && cbp_path.empty()) {
        std::cerr << "Error: No input file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!test_mode && !fs::exists(cbp_path)) {
        std::cerr << "Error: Input file not found: " << cbp_path << "\n";
        return 1;
    }

    // Output directory: relative to the project file, defaulting to its directory
    fs::path base_dir = test_mode ? fs::current_path() : fs::absolute(cbp_path).parent_path();
    fs::path output_dir = base_dir;
    if (!output_arg.empty()) {
        fs::path requested(output_arg);
        output_dir = requested.is_absolute() ? requested : base_dir / requested;
    }
    options.output_dir = output_dir.lexically_normal().string();

    cbp::Diagnostics diag;
    try {
        cbp::Pipeline pipeline(options, diag);
        std::unique_ptr<cbp::Workspace> workspace;

        if (test_mode) {
            std::cout << "Test mode: converting built-in sample project\n";
            workspace = pipeline.run_string(cbp::sample_project_xml(), base_dir.lexically_normal().string());
        } else {
            std::cout << "Parsing project: " << cbp_path << "\n";
            workspace = pipeline.run_file(cbp_path);
        }

        std::cout << "Project: " << workspace->project.title << "\n";
        std::cout << "Targets: " << workspace->project.targets.size()
                  << " (active: " << (workspace->active_target.empty() ? "none" : workspace->active_target) << ")\n";
        std::cout << "Linker: " << cbp::linker_type_to_string(options.linker_type) << "\n";

        // Render everything before touching the disk
        std::vector<cbp::GeneratedFile> files = pipeline.render(*workspace);

        report_warnings(diag);
        cbp::Pipeline::write_files(files, options.output_dir);

        std::cout << "\nSuccess! All files generated.\n";
        return 0;

    } catch (const cbp::CbpError& e) {
        report_warnings(diag);
        std::cerr << "Error [" << e.stage() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        report_warnings(diag);
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
