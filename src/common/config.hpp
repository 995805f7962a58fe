#pragma once

#include <optional>
#include <string>

namespace cbp {

// How the link step is invoked
enum class LinkerType {
    Gcc,    // Through the compiler driver (default)
    Ld      // Raw linker, entry point and script passed explicitly
};

// Shell dialect of the generated build script
enum class ScriptFlavor {
    Batch,  // build.bat
    Shell   // build.sh
};

inline ScriptFlavor host_script_flavor() {
#ifdef _WIN32
    return ScriptFlavor::Batch;
#else
    return ScriptFlavor::Shell;
#endif
}

inline std::optional<LinkerType> parse_linker_type(const std::string& value) {
    if (value == "gcc") return LinkerType::Gcc;
    if (value == "ld") return LinkerType::Ld;
    return std::nullopt;
}

inline const char* linker_type_to_string(LinkerType type) {
    return type == LinkerType::Ld ? "ld" : "gcc";
}

// Settings supplied by the command line
struct GeneratorOptions {
    LinkerType linker_type = LinkerType::Gcc;
    std::optional<std::string> ninja_path;        // Custom ninja executable
    std::optional<std::string> active_target;     // Defaults to the first buildable target
    bool header_insertion = true;                 // clangd Completion.HeaderInsertion
    std::string output_dir;                       // Where artifacts go, empty means the project directory
    ScriptFlavor script_flavor = host_script_flavor();
};

} // namespace cbp
