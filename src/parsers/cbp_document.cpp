#include "pch.h"
#include "cbp_document.hpp"
#include <pugixml.hpp>

namespace cbp {

constexpr const char* ROOT_ELEMENT = "CodeBlocks_project_file";

const std::string* RawElement::attribute(const std::string& key) const {
    for (const auto& attr : attributes) {
        if (attr.first == key) return &attr.second;
    }
    return nullptr;
}

std::string RawElement::attribute_or(const std::string& key, const std::string& fallback) const {
    const std::string* value = attribute(key);
    return value ? *value : fallback;
}

const RawElement* RawElement::child(const std::string& child_name) const {
    for (const auto& c : children) {
        if (c.name == child_name) return &c;
    }
    return nullptr;
}

std::vector<const RawElement*> RawElement::children_named(const std::string& child_name) const {
    std::vector<const RawElement*> result;
    for (const auto& c : children) {
        if (c.name == child_name) result.push_back(&c);
    }
    return result;
}

const std::string* RawElement::option(const std::string& key) const {
    for (const auto& c : children) {
        if (c.name != "Option") continue;
        if (const std::string* value = c.attribute(key)) return value;
    }
    return nullptr;
}

CbpDocument CbpDocumentParser::parse(const std::string& filepath) {
    pugi::xml_document doc;

    pugi::xml_parse_result result = doc.load_file(filepath.c_str());
    if (!result) {
        throw StructuralParseError("Failed to parse project file " + filepath + ": " +
                                   std::string(result.description()) +
                                   " (offset " + std::to_string(result.offset) + ")");
    }

    log::debug("loaded " + filepath);
    return build_document(doc.document_element());
}

CbpDocument CbpDocumentParser::parse_string(const std::string& content) {
    pugi::xml_document doc;

    pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size());
    if (!result) {
        throw StructuralParseError("Failed to parse project document: " +
                                   std::string(result.description()) +
                                   " (offset " + std::to_string(result.offset) + ")");
    }

    return build_document(doc.document_element());
}

RawElement CbpDocumentParser::convert(const pugi::xml_node& node) {
    RawElement element;
    element.name = node.name();

    for (auto attr : node.attributes()) {
        element.attributes.emplace_back(attr.name(), attr.value());
    }
    for (auto child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        element.children.push_back(convert(child));
    }
    return element;
}

CbpDocument CbpDocumentParser::build_document(const pugi::xml_node& root) {
    if (!root) {
        throw StructuralParseError("Empty project document");
    }
    if (std::string(root.name()) != ROOT_ELEMENT) {
        throw StructuralParseError("Invalid project file: expected <" + std::string(ROOT_ELEMENT) +
                                   "> root element, found <" + root.name() + ">");
    }

    RawElement tree = convert(root);

    CbpDocument doc;
    check_file_version(doc, tree.child("FileVersion"));

    const RawElement* project = tree.child("Project");
    if (!project) {
        throw StructuralParseError("Invalid project file: missing <Project> element");
    }
    doc.project = *project;

    validate(doc);
    return doc;
}

void CbpDocumentParser::check_file_version(CbpDocument& doc, const RawElement* file_version) {
    if (!file_version) {
        diag_.warn("No FileVersion found");
        return;
    }

    std::string major = file_version->attribute_or("major", "?");
    std::string minor = file_version->attribute_or("minor", "?");
    log::debug("FileVersion: " + major + "." + minor);

    try {
        size_t major_end = 0;
        size_t minor_end = 0;
        int maj = std::stoi(major, &major_end);
        int min = std::stoi(minor, &minor_end);
        if (major_end != major.size() || minor_end != minor.size()) {
            throw std::invalid_argument("trailing characters");
        }
        doc.file_version = std::make_pair(maj, min);
        if (!(maj == 1 && min >= 6)) {
            diag_.warn("FileVersion " + major + "." + minor + " may be incompatible");
        }
    } catch (const std::logic_error&) {
        diag_.warn("Invalid FileVersion format: " + major + "." + minor);
    }
}

void CbpDocumentParser::validate(const CbpDocument& doc) {
    const RawElement& project = doc.project;

    const RawElement* build = project.child("Build");
    if (!build) {
        throw StructuralParseError("Invalid project file: missing <Build> element");
    }

    auto targets = build->children_named("Target");
    if (targets.empty()) {
        throw StructuralParseError("Invalid project file: <Build> contains no <Target> element");
    }

    bool project_has_compiler = project.option("compiler") != nullptr;
    for (const RawElement* target : targets) {
        const std::string* title = target->attribute("title");
        if (!title || title->empty()) {
            throw StructuralParseError("Invalid project file: <Target> element without title");
        }
        if (!project_has_compiler && !target->option("compiler")) {
            throw StructuralParseError("Invalid project file: missing <Option compiler> for target '" +
                                       *title + "'");
        }
    }
}

} // namespace cbp
