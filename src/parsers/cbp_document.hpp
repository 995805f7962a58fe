#pragma once

#include "common/log.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pugi {
class xml_node;
}

namespace cbp {

// Generic element of a project document. Every element and attribute of
// the source document is kept, including ones this tool does not know.
struct RawElement {
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes;   // Document order
    std::vector<RawElement> children;                               // Document order

    const std::string* attribute(const std::string& key) const;
    std::string attribute_or(const std::string& key, const std::string& fallback = "") const;
    bool has_attribute(const std::string& key) const { return attribute(key) != nullptr; }

    const RawElement* child(const std::string& child_name) const;
    std::vector<const RawElement*> children_named(const std::string& child_name) const;

    // First <Option> child carrying the given attribute
    const std::string* option(const std::string& key) const;
};

// Structurally valid project document
struct CbpDocument {
    std::optional<std::pair<int, int>> file_version;    // (major, minor)
    RawElement project;                                  // The <Project> element
};

// Parser for Code::Blocks project files (.cbp)
class CbpDocumentParser {
public:
    explicit CbpDocumentParser(Diagnostics& diag) : diag_(diag) {}

    // Parse a .cbp file
    CbpDocument parse(const std::string& filepath);

    // Parse from string content
    CbpDocument parse_string(const std::string& content);

private:
    CbpDocument build_document(const pugi::xml_node& root);
    RawElement convert(const pugi::xml_node& node);
    void check_file_version(CbpDocument& doc, const RawElement* file_version);
    void validate(const CbpDocument& doc);

    Diagnostics& diag_;
};

} // namespace cbp
