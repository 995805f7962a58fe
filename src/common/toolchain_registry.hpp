#pragma once
#include <string>
#include <map>
#include <optional>
#include <vector>

#include "common/log.hpp"

namespace cbp {

// Compilers this tool knows how to drive. Adding a toolchain means adding
// an enumerator here, its release data in toolchain_release() and its ID in
// the registry constructor.
enum class CompilerFamily {
    RiscV32V1,
    RiscV32V2,
    RiscV32V3,
    Generic         // Unrecognized compiler ID, default options
};

// Toolchain behaviour derived from a compiler ID
struct ToolchainProfile {
    CompilerFamily family = CompilerFamily::Generic;
    std::string id;                 // Compiler ID as written in the project
    std::string version_name;       // "V2"
    std::string gcc_version;        // "10.2.0"
    std::string install_dir;        // <root>/RV32-V2, empty for the generic profile
    std::string tool_prefix;        // "riscv32-elf-"
    std::string target_triple;      // "riscv32-unknown-elf", empty if unknown
    std::vector<std::string> default_flags;

    bool is_known() const { return family != CompilerFamily::Generic; }

    // Stable token used in build-graph rule names ("riscv32_v2", "generic")
    std::string rule_suffix() const;

    std::string bin_dir() const;

    // Expected location of a tool ("gcc", "g++", "ar", "ld")
    std::string tool_path(const std::string& tool) const;

    // GCC system include directories
    std::vector<std::string> include_paths() const;

    // Directories the gcc driver searches for libgcc/libc
    std::vector<std::string> library_paths() const;
};

// Concrete tool commands for one profile
struct ToolSet {
    std::string cc;
    std::string cxx;
    std::string ar;
    std::string ld;
};

// Registry of supported toolchains
// Maps compiler IDs from the project file to profiles rooted at the
// toolchain installation directory.
class ToolchainRegistry {
public:
    static ToolchainRegistry& instance();

    // Family of a compiler ID (case-insensitive), nullopt if unrecognized
    std::optional<CompilerFamily> family_of(const std::string& compiler_id) const;

    // Resolve a compiler ID to a profile. Unrecognized IDs produce a warning
    // and the generic profile; the pipeline keeps going.
    ToolchainProfile resolve(const std::string& compiler_id, Diagnostics& diag) const;

    // Resolve tool commands for a profile. Missing executables fall back to
    // their bare names (expected on PATH) with a warning.
    ToolSet resolve_tools(const ToolchainProfile& profile, Diagnostics& diag) const;

    const std::string& root() const { return root_; }

    // Set toolchain installation root (used by CLI and environment variable)
    void set_root(const std::string& root);

private:
    ToolchainRegistry();
    ToolchainRegistry(const ToolchainRegistry&) = delete;
    ToolchainRegistry& operator=(const ToolchainRegistry&) = delete;

    std::map<std::string, CompilerFamily> compilers_;     // compiler id -> family
    std::string root_;
};

} // namespace cbp
