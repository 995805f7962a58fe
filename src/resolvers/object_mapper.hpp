#pragma once

#include "common/log.hpp"
#include "common/project_types.hpp"
#include <string>
#include <vector>

namespace cbp {

// How a unit is turned into an object
enum class SourceKind {
    C,                      // .c
    Cxx,                    // .cpp .CPP .C .cc .cxx
    PreprocessedAssembly,   // .S (runs the preprocessor, emits a depfile)
    Assembly,               // .s
    Special,                // Custom build command
    Ignored                 // Headers, compile="0", unknown extensions
};

const char* source_kind_to_string(SourceKind kind);

// Classification by extension only. Case matters: ".C" is C++, ".S" is
// preprocessed assembly.
SourceKind classify_extension(const std::string& path);

inline bool is_normal_source(SourceKind kind) {
    return kind == SourceKind::C || kind == SourceKind::Cxx;
}

inline bool is_assembly_source(SourceKind kind) {
    return kind == SourceKind::Assembly || kind == SourceKind::PreprocessedAssembly;
}

// Object path for a source: object_root + relative source path with the
// extension replaced by ".o". ".." segments become "_up", absolute paths
// are placed under "_abs/" (a drive letter X: becomes "_X") and a segment
// already starting with '_' is prefixed with another one. No object lands
// outside object_root and distinct sources never share an object.
std::string map_object_path(const std::string& object_root, const std::string& source_path);

// Custom build command of a unit for a compiler. The command registered for
// that compiler wins, otherwise the first one.
const CustomBuild* select_custom_build(const SourceFile& source, const std::string& compiler_id);

// A unit as compiled within one target
struct ClassifiedSource {
    const SourceFile* source = nullptr;
    SourceKind kind = SourceKind::Ignored;
    std::string object;                         // Mapped object, empty for ignored units
    const CustomBuild* custom_build = nullptr;  // Set for special units
};

class ObjectMapper {
public:
    explicit ObjectMapper(Diagnostics& diag) : diag_(diag) {}

    // Classify the units of a target (document order) and map their objects.
    // Throws PathMappingError when two units would share one object.
    std::vector<ClassifiedSource> map_target(const Target& target, const std::vector<SourceFile>& sources);

private:
    Diagnostics& diag_;
};

} // namespace cbp
