#include "pch.h"
#include "toolchain_registry.hpp"

namespace fs = std::filesystem;

namespace cbp {

namespace {

#ifdef _WIN32
constexpr const char* DEFAULT_TOOLCHAIN_ROOT = "C:\\Program Files (x86)\\RV32-Toolchain";
constexpr const char* EXE_SUFFIX = ".exe";
#else
constexpr const char* DEFAULT_TOOLCHAIN_ROOT = "/opt/RV32-Toolchain";
constexpr const char* EXE_SUFFIX = "";
#endif

constexpr const char* ROOT_ENV_VAR = "RV32_TOOLCHAIN_ROOT";

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

struct ToolchainRelease {
    const char* version_name;
    const char* gcc_version;
};

ToolchainRelease toolchain_release(CompilerFamily family) {
    switch (family) {
        case CompilerFamily::RiscV32V1: return {"V1", "6.1.0"};
        case CompilerFamily::RiscV32V2: return {"V2", "10.2.0"};
        case CompilerFamily::RiscV32V3: return {"V3", "14.2.0"};
        case CompilerFamily::Generic: break;
    }
    return {"", ""};
}

} // namespace

std::string ToolchainProfile::rule_suffix() const {
    if (!is_known()) return "generic";
    std::string suffix = id;
    for (auto& c : suffix) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return suffix;
}

std::string ToolchainProfile::bin_dir() const {
    if (install_dir.empty()) return "";
    return (fs::path(install_dir) / "bin").string();
}

std::string ToolchainProfile::tool_path(const std::string& tool) const {
    if (!is_known()) return tool;
    return (fs::path(bin_dir()) / (tool_prefix + tool + EXE_SUFFIX)).string();
}

std::vector<std::string> ToolchainProfile::include_paths() const {
    if (!is_known()) return {};
    fs::path base(install_dir);
    fs::path gcc_dir = base / "lib" / "gcc" / "riscv32-elf" / gcc_version;
    return {
        (gcc_dir / "include").string(),
        (gcc_dir / "include-fixed").string(),
        (base / "riscv32-elf" / "include").string(),
    };
}

std::vector<std::string> ToolchainProfile::library_paths() const {
    if (!is_known()) return {};
    fs::path base(install_dir);
    return {
        (base / "lib" / "gcc" / "riscv32-elf" / gcc_version).string(),
        (base / "riscv32-elf" / "lib").string(),
    };
}

ToolchainRegistry& ToolchainRegistry::instance() {
    static ToolchainRegistry registry;
    return registry;
}

ToolchainRegistry::ToolchainRegistry() : root_(DEFAULT_TOOLCHAIN_ROOT) {
    compilers_["riscv32-v1"] = CompilerFamily::RiscV32V1;
    compilers_["riscv32-v2"] = CompilerFamily::RiscV32V2;
    compilers_["riscv32-v3"] = CompilerFamily::RiscV32V3;

    if (const char* env_root = std::getenv(ROOT_ENV_VAR)) {
        if (*env_root != '\0') {
            root_ = env_root;
        }
    }
}

void ToolchainRegistry::set_root(const std::string& root) {
    root_ = root;
}

std::optional<CompilerFamily> ToolchainRegistry::family_of(const std::string& compiler_id) const {
    auto it = compilers_.find(lowercase(compiler_id));
    if (it != compilers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

ToolchainProfile ToolchainRegistry::resolve(const std::string& compiler_id, Diagnostics& diag) const {
    ToolchainProfile profile;
    profile.id = compiler_id;

    std::optional<CompilerFamily> family = family_of(compiler_id);
    if (!family) {
        diag.warn("Unknown compiler '" + compiler_id + "', using default options");
        profile.family = CompilerFamily::Generic;
        profile.default_flags = {"-xc"};
        return profile;
    }

    const ToolchainRelease release = toolchain_release(*family);
    profile.family = *family;
    profile.id = lowercase(compiler_id);
    profile.version_name = release.version_name;
    profile.gcc_version = release.gcc_version;
    profile.install_dir = (fs::path(root_) / ("RV32-" + profile.version_name)).string();
    profile.tool_prefix = "riscv32-elf-";
    profile.target_triple = "riscv32-unknown-elf";
    profile.default_flags = {"-xc", "--target=" + profile.target_triple};

    log::debug("compiler '" + compiler_id + "' -> " + profile.install_dir +
               " (gcc " + profile.gcc_version + ")");
    return profile;
}

ToolSet ToolchainRegistry::resolve_tools(const ToolchainProfile& profile, Diagnostics& diag) const {
    std::vector<std::string> missing;
    auto pick = [&](const std::string& tool) {
        std::string path = profile.tool_path(tool);
        if (!profile.is_known()) return path;

        std::error_code ec;
        if (fs::exists(path, ec)) return path;

        missing.push_back(tool);
        return profile.tool_prefix + tool;
    };

    ToolSet tools;
    tools.cc = pick("gcc");
    tools.cxx = pick("g++");
    tools.ar = pick("ar");
    tools.ld = pick("ld");

    if (!missing.empty()) {
        std::string list;
        for (const auto& tool : missing) {
            if (!list.empty()) list += ", ";
            list += profile.tool_prefix + tool;
        }
        diag.warn("Toolchain tools not found in " + profile.bin_dir() + ", expecting " + list + " on PATH");
    }
    return tools;
}

} // namespace cbp
