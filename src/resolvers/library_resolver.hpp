#pragma once

#include "common/config.hpp"
#include "common/project_types.hpp"
#include "common/toolchain_registry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cbp {

// One entry of a target's library set
struct LibraryRef {
    std::string reference;          // As written ("m", "libfoo", "lib/libx.a", "-lm")
    std::string link_argument;      // "-lm", or the path for path-qualified entries
    bool path_qualified = false;
    std::string internal_target;    // Producing target, empty for external libraries
    std::string resolved_file;      // Archive located on disk or built by the project

    bool is_internal() const { return !internal_target.empty(); }
};

// Linker options split into the parts the link statement needs
struct LinkerOptionScan {
    std::vector<std::string> driver_options;    // Remaining options, gcc driver form
    std::vector<std::string> linker_options;    // Remaining options, -Wl, unwrapped
    std::vector<std::string> libraries;         // -l<name>, *.a and *.o found among the options
    std::vector<std::string> library_dirs;      // -L<dir>
    std::optional<std::string> link_script;
    std::optional<std::string> entry_symbol;
};

// Resolved link step of one target
struct LinkPlan {
    LinkerType linker_type = LinkerType::Gcc;
    std::vector<LibraryRef> libraries;          // LibrarySet, link order
    std::vector<std::string> pre_flags;         // Arguments placed before the objects
    std::optional<std::string> link_script;
    std::optional<std::string> entry_symbol;    // Always set in ld mode
    std::vector<std::string> implicit_inputs;   // Archives, link script, external deps
    std::vector<std::string> dependencies;      // Targets whose outputs are linked in

    std::vector<std::string> lib_flags() const;
};

// Link argument for a library reference: path-qualified entries are kept,
// bare names become -l<name> ("libfoo" -> "-lfoo", "m" -> "-lm").
std::string to_link_argument(const std::string& reference);

bool is_path_qualified_library(const std::string& reference);

// Extract libraries, search directories, link script and entry symbol from
// linker option strings. Remaining options are returned in both shapes.
LinkerOptionScan scan_linker_options(const std::vector<std::string>& options);

// Options only the gcc driver understands (dropped when invoking ld directly)
bool is_driver_only_option(const std::string& option);

// Concatenate project, target and linker-option libraries, keeping the
// first occurrence of each link argument.
std::vector<LibraryRef> merge_libraries(const std::vector<std::string>& project_libraries,
                                        const std::vector<std::string>& target_libraries,
                                        const std::vector<std::string>& linker_libraries);

class LibraryResolver {
public:
    LibraryResolver(const ProjectInfo& project, const std::string& project_dir,
                    LinkerType linker_type, Diagnostics& diag)
        : project_(project), project_dir_(project_dir), linker_type_(linker_type), diag_(diag) {}

    // Resolve the library set and link command fragments of a buildable target.
    // Throws LibraryResolutionError when an archive expected from this
    // project has no producing target.
    LinkPlan resolve(const Target& target, const ToolchainProfile& profile) const;

    // Targets in document order, except that library producers come before
    // the targets linking them. Throws LibraryResolutionError on cycles.
    std::vector<const Target*> build_order(const std::map<std::string, LinkPlan>& plans) const;

private:
    // Target of this project whose output the reference names, if any
    const Target* find_producer(const LibraryRef& ref, const Target& consumer,
                                const std::vector<std::string>& library_dirs) const;

    // Archive expected in a library output directory of this project
    bool in_project_library_dir(const std::string& path) const;

    // Look an external library up on disk, "" when not found
    std::string locate_external(const LibraryRef& ref, const std::vector<std::string>& library_dirs) const;

    bool exists_in_project(const std::string& path) const;

    const ProjectInfo& project_;
    std::string project_dir_;
    LinkerType linker_type_;
    Diagnostics& diag_;
};

} // namespace cbp
