#pragma once

#include "pch.h"
#include "parsers/cbp_document.hpp"
#include "parsers/project_model_builder.hpp"
#include "pipeline.hpp"
#include <gtest/gtest.h>
#include <random>

namespace cbp::test {

// Wrap <Project> content in a complete project document
inline std::string cbp_project(const std::string& project_body) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\" ?>\n"
           "<CodeBlocks_project_file>\n"
           "  <FileVersion major=\"1\" minor=\"6\" />\n"
           "  <Project>\n" +
           project_body +
           "  </Project>\n"
           "</CodeBlocks_project_file>\n";
}

inline ProjectInfo build_project(const std::string& xml, Diagnostics& diag) {
    CbpDocumentParser parser(diag);
    CbpDocument doc = parser.parse_string(xml);
    ProjectModelBuilder builder(diag);
    return builder.build(doc);
}

// Scratch directory removed when the test ends
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        path_ = std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(std::random_device{}()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    // Create a file (and its directories) below the scratch directory
    void write(const std::string& relative, const std::string& content = "") const {
        std::filesystem::path file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
    }

private:
    std::filesystem::path path_;
};

// Statement producing an output, or nullptr
inline const BuildStatement* producer(const Workspace& ws, const std::string& output) {
    return ws.graph.find_producer(output);
}

inline bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

inline bool contains_text(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace cbp::test
