#include "pch.h"
#include "library_resolver.hpp"
#include "resolvers/compiler_flags.hpp"
#include "common/path_utils.hpp"
#include <functional>

namespace fs = std::filesystem;

namespace cbp {

namespace {

constexpr const char* DEFAULT_ENTRY_SYMBOL = "_start";

bool starts_with(const std::string& str, const char* prefix) {
    return str.rfind(prefix, 0) == 0;
}

// -Ttext=, -Tdata=, -Tbss= and the segment variants set addresses, not scripts
bool is_section_address_option(const std::string& option) {
    return starts_with(option, "-Ttext") || starts_with(option, "-Tdata") ||
           starts_with(option, "-Tbss") || starts_with(option, "-Trodata") ||
           starts_with(option, "-Tldata");
}

bool is_object_or_archive(const std::string& token) {
    if (token.empty() || token[0] == '-') return false;
    std::string ext = file_extension(token);
    return ext == ".a" || ext == ".o";
}

std::vector<std::string> split_commas(const std::string& value) {
    std::vector<std::string> pieces;
    std::stringstream ss(value);
    std::string piece;
    while (std::getline(ss, piece, ',')) {
        if (!piece.empty()) pieces.push_back(piece);
    }
    return pieces;
}

std::string join(const std::vector<std::string>& values, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += sep;
        result += values[i];
    }
    return result;
}

// Handle the pieces of one -Wl,a,b,c option
void scan_wl_option(const std::string& value, LinkerOptionScan& scan) {
    std::vector<std::string> pieces = split_commas(value);
    std::vector<std::string> remaining;

    for (size_t i = 0; i < pieces.size(); ++i) {
        const std::string& piece = pieces[i];
        bool has_next = i + 1 < pieces.size();

        if ((piece == "-T" || piece == "--script") && has_next) {
            scan.link_script = to_unix_path(pieces[++i]);
        } else if (starts_with(piece, "--script=")) {
            scan.link_script = to_unix_path(piece.substr(9));
        } else if (starts_with(piece, "-T") && piece.size() > 2 && !is_section_address_option(piece)) {
            scan.link_script = to_unix_path(piece.substr(2));
        } else if ((piece == "-e" || piece == "--entry") && has_next) {
            scan.entry_symbol = pieces[++i];
        } else if (starts_with(piece, "--entry=")) {
            scan.entry_symbol = piece.substr(8);
        } else if (starts_with(piece, "-L") && piece.size() > 2) {
            scan.library_dirs.push_back(to_unix_path(piece.substr(2)));
        } else if (starts_with(piece, "-l") && piece.size() > 2) {
            scan.libraries.push_back(piece);
        } else {
            remaining.push_back(piece);
        }
    }

    if (!remaining.empty()) {
        scan.driver_options.push_back("-Wl," + join(remaining, ","));
        scan.linker_options.insert(scan.linker_options.end(), remaining.begin(), remaining.end());
    }
}

} // namespace

std::vector<std::string> LinkPlan::lib_flags() const {
    std::vector<std::string> flags;
    for (const auto& lib : libraries) {
        flags.push_back(lib.link_argument);
    }
    return flags;
}

bool is_path_qualified_library(const std::string& reference) {
    if (starts_with(reference, "-l")) return false;
    if (is_absolute_path(reference)) return true;
    if (reference.find('/') != std::string::npos || reference.find('\\') != std::string::npos) return true;
    std::string ext = file_extension(reference);
    return ext == ".o" || ext == ".obj";
}

std::string to_link_argument(const std::string& reference) {
    if (starts_with(reference, "-l")) return reference;
    if (is_path_qualified_library(reference)) return to_unix_path(reference);

    std::string name = reference;
    std::string ext = file_extension(name);
    if (ext == ".a" || ext == ".so" || ext == ".lib" || ext == ".dll") {
        name = name.substr(0, name.size() - ext.size());
    }
    if (name.size() > 3 && starts_with(name, "lib")) {
        name = name.substr(3);
    }
    return "-l" + name;
}

bool is_driver_only_option(const std::string& option) {
    if (starts_with(option, "-Wl,")) return false;
    return starts_with(option, "-m") || starts_with(option, "-f") || starts_with(option, "-O") ||
           starts_with(option, "-specs=") || starts_with(option, "--specs=") ||
           starts_with(option, "-std=") || starts_with(option, "-W") ||
           option == "-nostartfiles" || option == "-nodefaultlibs" || option == "-pipe" ||
           option == "-pthread" || starts_with(option, "-static-lib");
}

LinkerOptionScan scan_linker_options(const std::vector<std::string>& options) {
    std::vector<std::string> tokens;
    for (const auto& option : options) {
        for (const auto& token : split_command_line(option)) {
            tokens.push_back(token);
        }
    }

    LinkerOptionScan scan;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        bool has_next = i + 1 < tokens.size();

        if (token == "-T" && has_next) {
            scan.link_script = to_unix_path(tokens[++i]);
        } else if (starts_with(token, "--script=")) {
            scan.link_script = to_unix_path(token.substr(9));
        } else if (starts_with(token, "-T") && token.size() > 2 && !is_section_address_option(token)) {
            scan.link_script = to_unix_path(token.substr(2));
        } else if ((token == "-e" || token == "--entry") && has_next) {
            scan.entry_symbol = tokens[++i];
        } else if (starts_with(token, "--entry=")) {
            scan.entry_symbol = token.substr(8);
        } else if (token == "-l" && has_next) {
            scan.libraries.push_back("-l" + tokens[++i]);
        } else if (starts_with(token, "-l") && token.size() > 2) {
            scan.libraries.push_back(token);
        } else if (token == "-L" && has_next) {
            scan.library_dirs.push_back(to_unix_path(tokens[++i]));
        } else if (starts_with(token, "-L") && token.size() > 2) {
            scan.library_dirs.push_back(to_unix_path(token.substr(2)));
        } else if (starts_with(token, "-Wl,")) {
            scan_wl_option(token.substr(4), scan);
        } else if (token == "-Xlinker" && has_next) {
            const std::string& value = tokens[++i];
            scan.driver_options.push_back(token);
            scan.driver_options.push_back(value);
            scan.linker_options.push_back(value);
        } else if (is_object_or_archive(token)) {
            scan.libraries.push_back(token);
        } else {
            scan.driver_options.push_back(token);
            if (!is_driver_only_option(token)) {
                scan.linker_options.push_back(token);
            }
        }
    }
    return scan;
}

std::vector<LibraryRef> merge_libraries(const std::vector<std::string>& project_libraries,
                                        const std::vector<std::string>& target_libraries,
                                        const std::vector<std::string>& linker_libraries) {
    std::vector<LibraryRef> result;
    std::set<std::string> seen;

    auto add = [&](const std::vector<std::string>& source) {
        for (const auto& reference : source) {
            LibraryRef ref;
            ref.reference = reference;
            ref.link_argument = to_link_argument(reference);
            ref.path_qualified = is_path_qualified_library(reference);
            if (!seen.insert(ref.link_argument).second) {
                log::debug("library '" + reference + "' already in link set, skipped");
                continue;
            }
            result.push_back(ref);
        }
    };

    add(project_libraries);
    add(target_libraries);
    add(linker_libraries);
    return result;
}

bool LibraryResolver::exists_in_project(const std::string& path) const {
    fs::path candidate = is_absolute_path(path) ? fs::path(path) : fs::path(project_dir_) / path;
    std::error_code ec;
    return fs::is_regular_file(candidate, ec);
}

const Target* LibraryResolver::find_producer(const LibraryRef& ref, const Target& consumer,
                                             const std::vector<std::string>& library_dirs) const {
    for (const auto& candidate : project_.targets) {
        if (!candidate.is_buildable() || candidate.output.empty()) continue;
        if (!candidate.is_static_library() && !candidate.is_dynamic_library()) continue;

        if (ref.path_qualified) {
            if (normalize_path(ref.link_argument) == normalize_path(candidate.output)) return &candidate;
            continue;
        }

        if (!starts_with(ref.link_argument, "-l") || starts_with(ref.link_argument, "-l:")) continue;
        std::string name = ref.link_argument.substr(2);
        std::string produced = file_name(candidate.output);
        if (produced != "lib" + name + ".a" && produced != "lib" + name + ".so") continue;

        std::string out_dir = normalize_path(parent_path(candidate.output));
        for (const auto& dir : library_dirs) {
            if (normalize_path(dir) == out_dir) return &candidate;
        }
        diag_.warn("Target '" + consumer.name + "' links " + ref.link_argument + ", which matches the output of target '" +
                   candidate.name + "', but '" + out_dir + "' is not one of its library directories");
    }
    return nullptr;
}

bool LibraryResolver::in_project_library_dir(const std::string& path) const {
    std::string dir = normalize_path(parent_path(path));
    for (const auto& target : project_.targets) {
        if (!target.is_static_library() || target.output.empty()) continue;
        if (normalize_path(parent_path(target.output)) == dir) return true;
    }
    return false;
}

std::string LibraryResolver::locate_external(const LibraryRef& ref,
                                             const std::vector<std::string>& library_dirs) const {
    if (ref.path_qualified) {
        if (!exists_in_project(ref.link_argument)) return "";
        return is_absolute_path(ref.link_argument) ? ref.link_argument : normalize_path(ref.link_argument);
    }

    std::string file;
    if (starts_with(ref.link_argument, "-l:")) {
        file = ref.link_argument.substr(3);
    } else {
        file = "lib" + ref.link_argument.substr(2) + ".a";
    }

    for (const auto& dir : library_dirs) {
        std::string candidate = join_path(dir, file);
        if (exists_in_project(candidate)) {
            return is_absolute_path(candidate) ? candidate : normalize_path(candidate);
        }
    }
    return "";
}

LinkPlan LibraryResolver::resolve(const Target& target, const ToolchainProfile& profile) const {
    LinkPlan plan;
    plan.linker_type = linker_type_;

    LinkerOptionScan scan = scan_linker_options(target.linker_options);
    plan.link_script = scan.link_script;
    plan.entry_symbol = scan.entry_symbol;

    std::vector<std::string> library_dirs = target.library_dirs;
    library_dirs.insert(library_dirs.end(), scan.library_dirs.begin(), scan.library_dirs.end());
    library_dirs = dedupe_preserving_order(library_dirs);

    plan.libraries = merge_libraries(target.project_libraries, target.target_libraries, scan.libraries);

    for (auto& ref : plan.libraries) {
        if (const Target* producer = find_producer(ref, target, library_dirs)) {
            if (producer->name == target.name) {
                throw LibraryResolutionError("Target '" + target.name + "' links its own output '" +
                                             producer->output + "'");
            }
            ref.internal_target = producer->name;
            ref.resolved_file = producer->output;
            ref.link_argument = producer->output;
            plan.dependencies.push_back(producer->name);
            log::debug("target '" + target.name + "': '" + ref.reference + "' is built by target '" +
                       producer->name + "'");
            continue;
        }

        if (ref.path_qualified && file_extension(ref.link_argument) == ".a" &&
            in_project_library_dir(ref.link_argument) && !exists_in_project(ref.link_argument)) {
            throw LibraryResolutionError("Target '" + target.name + "' links static library '" + ref.reference +
                                         "', but no target of this project builds it");
        }

        ref.resolved_file = locate_external(ref, library_dirs);
        if (ref.resolved_file.empty()) {
            log::debug("target '" + target.name + "': library '" + ref.reference +
                       "' not found in the project, left to the linker search path");
        }
    }

    if (linker_type_ == LinkerType::Ld) {
        std::vector<std::string> dropped;
        for (const auto& option : scan.driver_options) {
            if (!starts_with(option, "-Wl,") && is_driver_only_option(option)) dropped.push_back(option);
        }
        if (!dropped.empty()) {
            diag_.warn("Target '" + target.name + "': ld does not accept " + join(dropped, " ") + ", dropped");
        }

        plan.pre_flags = scan.linker_options;
        for (const auto& dir : library_dirs) {
            plan.pre_flags.push_back("-L" + dir);
        }
        for (const auto& dir : profile.library_paths()) {
            plan.pre_flags.push_back("-L" + to_unix_path(dir));
        }
        if (!plan.entry_symbol) plan.entry_symbol = DEFAULT_ENTRY_SYMBOL;
        plan.pre_flags.push_back("-e");
        plan.pre_flags.push_back(*plan.entry_symbol);
        if (plan.link_script) {
            plan.pre_flags.push_back("-T");
            plan.pre_flags.push_back(*plan.link_script);
        }
    } else {
        plan.pre_flags = scan.driver_options;
        for (const auto& dir : library_dirs) {
            plan.pre_flags.push_back("-L" + dir);
        }
        if (plan.link_script) {
            plan.pre_flags.push_back("-T");
            plan.pre_flags.push_back(*plan.link_script);
        }
        if (plan.entry_symbol) {
            plan.pre_flags.push_back("-e");
            plan.pre_flags.push_back(*plan.entry_symbol);
        }
    }

    for (const auto& ref : plan.libraries) {
        if (!ref.resolved_file.empty()) plan.implicit_inputs.push_back(ref.resolved_file);
    }
    if (plan.link_script) {
        if (exists_in_project(*plan.link_script)) {
            plan.implicit_inputs.push_back(normalize_path(*plan.link_script));
        } else {
            diag_.warn("Target '" + target.name + "': link script '" + *plan.link_script + "' not found");
        }
    }
    plan.implicit_inputs.insert(plan.implicit_inputs.end(), target.external_deps.begin(), target.external_deps.end());
    plan.implicit_inputs = dedupe_preserving_order(plan.implicit_inputs);

    return plan;
}

std::vector<const Target*> LibraryResolver::build_order(const std::map<std::string, LinkPlan>& plans) const {
    std::vector<const Target*> order;
    std::map<std::string, int> state;       // 1 = visiting, 2 = done

    std::function<void(const Target&)> visit = [&](const Target& target) {
        if (state[target.name] == 2) return;
        if (state[target.name] == 1) {
            throw LibraryResolutionError("Circular library dependency involving target '" + target.name + "'");
        }
        state[target.name] = 1;

        auto it = plans.find(target.name);
        if (it != plans.end()) {
            for (const auto& dep : it->second.dependencies) {
                if (const Target* producer = project_.find_target(dep)) visit(*producer);
            }
        }

        state[target.name] = 2;
        order.push_back(&target);
    };

    for (const auto& target : project_.targets) {
        visit(target);
    }
    return order;
}

} // namespace cbp
