#include "pch.h"
#include "object_mapper.hpp"
#include "common/path_utils.hpp"

namespace cbp {

namespace {

constexpr const char* OBJECT_EXTENSION = ".o";
constexpr const char* PARENT_TOKEN = "_up";
constexpr const char* ABSOLUTE_TOKEN = "_abs";

bool is_header(const std::string& ext) {
    return ext == ".h" || ext == ".H" || ext == ".hpp" || ext == ".hh" || ext == ".hxx" || ext == ".inc";
}

} // namespace

const char* source_kind_to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::C: return "C";
        case SourceKind::Cxx: return "C++";
        case SourceKind::PreprocessedAssembly: return "assembly (preprocessed)";
        case SourceKind::Assembly: return "assembly";
        case SourceKind::Special: return "custom build";
        case SourceKind::Ignored: return "ignored";
        default: return "unknown";
    }
}

SourceKind classify_extension(const std::string& path) {
    std::string ext = file_extension(path);
    if (ext == ".c") return SourceKind::C;
    if (ext == ".cpp" || ext == ".CPP" || ext == ".C" || ext == ".cc" || ext == ".cxx") return SourceKind::Cxx;
    if (ext == ".S") return SourceKind::PreprocessedAssembly;
    if (ext == ".s") return SourceKind::Assembly;
    return SourceKind::Ignored;
}

std::string map_object_path(const std::string& object_root, const std::string& source_path) {
    std::string rel = normalize_path(source_path);
    std::string ext = file_extension(rel);
    rel = rel.substr(0, rel.size() - ext.size());

    // Marker segments start with a single '_'. Real segments starting with
    // '_' get one more, so "../a.c" and "__/a.c" stay apart.
    std::vector<std::string> segments;
    if (is_absolute_path(rel)) {
        segments.push_back(ABSOLUTE_TOKEN);
        if (rel.size() >= 2 && rel[1] == ':') {
            segments.push_back(std::string("_") + rel[0]);
            rel = rel.substr(2);
        }
    }

    std::string segment;
    std::istringstream parts(rel);
    while (std::getline(parts, segment, '/')) {
        if (segment.empty()) continue;
        if (segment == "..") {
            segments.push_back(PARENT_TOKEN);
        } else if (segment.front() == '_') {
            segments.push_back("_" + segment);
        } else {
            segments.push_back(segment);
        }
    }

    std::string mapped;
    for (const auto& part : segments) {
        if (!mapped.empty()) mapped += '/';
        mapped += part;
    }
    return join_path(object_root, mapped + OBJECT_EXTENSION);
}

const CustomBuild* select_custom_build(const SourceFile& source, const std::string& compiler_id) {
    if (source.custom_builds.empty()) return nullptr;
    for (const auto& build : source.custom_builds) {
        if (build.compiler_id == compiler_id) return &build;
    }
    return &source.custom_builds.front();
}

std::vector<ClassifiedSource> ObjectMapper::map_target(const Target& target, const std::vector<SourceFile>& sources) {
    std::vector<ClassifiedSource> result;
    std::map<std::string, std::string> owners;  // object -> source

    for (const auto& source : sources) {
        if (!source.applies_to(target.name)) continue;

        ClassifiedSource entry;
        entry.source = &source;

        if (!source.compile) {
            log::debug("target '" + target.name + "': " + source.path + " not compiled (compile=\"0\")");
            result.push_back(entry);
            continue;
        }

        if (const CustomBuild* build = select_custom_build(source, target.compiler_id)) {
            entry.kind = SourceKind::Special;
            entry.custom_build = build;
        } else {
            entry.kind = classify_extension(source.path);
            std::string ext = file_extension(source.path);
            if (entry.kind == SourceKind::Ignored && !ext.empty() && !is_header(ext)) {
                diag_.warn("Unit '" + source.path + "' has no build rule for '" + ext + "' files, skipped");
            }
        }

        if (entry.kind != SourceKind::Ignored) {
            entry.object = map_object_path(target.object_output, source.path);

            auto it = owners.find(entry.object);
            if (it != owners.end()) {
                throw PathMappingError("Target '" + target.name + "': sources '" + it->second + "' and '" +
                                       source.path + "' both map to object '" + entry.object + "'");
            }
            owners[entry.object] = source.path;
            log::debug("target '" + target.name + "': " + source.path + " [" + source_kind_to_string(entry.kind) +
                       "] -> " + entry.object);
        }

        result.push_back(entry);
    }
    return result;
}

} // namespace cbp
