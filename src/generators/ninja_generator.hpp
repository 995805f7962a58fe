#pragma once

#include "common/generator.hpp"
#include <string>
#include <vector>

namespace cbp {

// Generator for ninja build files (build.ninja)
class NinjaGenerator : public Generator {
public:
    NinjaGenerator() = default;

    std::vector<GeneratedFile> generate(const Workspace& workspace, const GeneratorOptions& options) override;

    std::string name() const override { return "ninja"; }

    std::string description() const override {
        return "Ninja build file (build.ninja) with compile, archive and link statements";
    }

    static std::string render(const Workspace& workspace);
};

// Escape a path on a build line ('$', ' ' and ':')
std::string ninja_escape_path(const std::string& path);

// Escape a variable value ('$')
std::string ninja_escape_value(const std::string& value);

} // namespace cbp
