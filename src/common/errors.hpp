#pragma once

#include <stdexcept>
#include <string>

namespace cbp {

enum class ErrorKind {
    StructuralParse,
    SemanticModel,
    LibraryResolution,
    PathMapping
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StructuralParse: return "StructuralParseError";
        case ErrorKind::SemanticModel: return "SemanticModelError";
        case ErrorKind::LibraryResolution: return "LibraryResolutionError";
        case ErrorKind::PathMapping: return "PathMappingError";
        default: return "Error";
    }
}

// Fatal pipeline error. The stage names the component that gave up.
class CbpError : public std::runtime_error {
public:
    CbpError(ErrorKind kind, const std::string& stage, const std::string& message)
        : std::runtime_error(message), kind_(kind), stage_(stage) {}

    ErrorKind kind() const { return kind_; }
    const std::string& stage() const { return stage_; }

private:
    ErrorKind kind_;
    std::string stage_;
};

// Malformed or incomplete project document
class StructuralParseError : public CbpError {
public:
    explicit StructuralParseError(const std::string& message)
        : CbpError(ErrorKind::StructuralParse, "parse", message) {}
};

// Document is well-formed but cannot be turned into a usable model
class SemanticModelError : public CbpError {
public:
    explicit SemanticModelError(const std::string& message)
        : CbpError(ErrorKind::SemanticModel, "model", message) {}
};

// A static library built by this project cannot be located
class LibraryResolutionError : public CbpError {
public:
    explicit LibraryResolutionError(const std::string& message)
        : CbpError(ErrorKind::LibraryResolution, "link", message) {}
};

// Two objects would share one output path
class PathMappingError : public CbpError {
public:
    explicit PathMappingError(const std::string& message)
        : CbpError(ErrorKind::PathMapping, "objects", message) {}
};

} // namespace cbp
