#pragma once

#include "common/project_types.hpp"
#include "common/toolchain_registry.hpp"
#include <string>
#include <utility>
#include <vector>

namespace cbp {

// Architecture selection (-march=) split into base ISA and vendor extensions
struct MarchInfo {
    std::string full_flag;          // "-march=rv32imac_xfoo", empty when absent
    std::string base;               // "rv32imac"
    std::string extension;          // "_xfoo", as written after the split point

    bool present() const { return !full_flag.empty(); }
    bool has_custom_extension() const { return !extension.empty(); }
    std::string base_flag() const { return "-march=" + base; }
};

// Split a -march value at the end of the canonical RISC-V base ISA.
// Everything from the first component that is not a standard extension
// (single-letter, or a multi-letter 'z'/'s' extension) onwards is returned
// as the second element. Values that are not RISC-V ISA strings are
// returned whole. split_march(a + b) == {a, b} for any result {a, b}.
std::pair<std::string, std::string> split_march(const std::string& value);

// Find the effective -march= flag (the last one wins, as with GCC)
MarchInfo detect_march(const std::vector<std::string>& flags);

// Key identifying which flags configure the same setting: "-O2" and "-O0"
// share "-O", "-DX=1" and "-UX" share "macro:X", "-fno-rtti" and "-frtti"
// share "-frtti".
std::string flag_key(const std::string& flag);

// Target flags with per-file overrides applied. Flags whose key appears in
// the overrides are replaced; the result is free of exact duplicates.
std::vector<std::string> apply_flag_overrides(const std::vector<std::string>& base,
                                              const std::vector<std::string>& overrides);

// Remove exact duplicates, keeping the first occurrence
std::vector<std::string> dedupe_preserving_order(const std::vector<std::string>& values);

// Flattened per-target compile settings
struct ResolvedOptions {
    std::string target_name;
    ToolchainProfile profile;
    std::vector<std::string> compiler_flags;   // Option entries, one per <Add option>
    std::vector<std::string> include_dirs;
    MarchInfo march;

    std::vector<std::string> include_flags() const;
};

class CompilerFlagAnalyzer {
public:
    explicit CompilerFlagAnalyzer(Diagnostics& diag) : diag_(diag) {}

    ResolvedOptions analyze(const Target& target);

    // Option entries for one source file in a target
    std::vector<std::string> flags_for(const ResolvedOptions& options, const SourceFile& source) const;

    // Include directories for one source file in a target
    std::vector<std::string> include_dirs_for(const ResolvedOptions& options, const SourceFile& source) const;

private:
    Diagnostics& diag_;
};

} // namespace cbp
