#include "pch.h"
#include "ninja_generator.hpp"

namespace cbp {

namespace {

constexpr const char* REQUIRED_NINJA_VERSION = "1.5";

void write_paths(std::ostringstream& out, const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        out << " " << ninja_escape_path(path);
    }
}

void write_rule(std::ostringstream& out, const BuildRule& rule) {
    out << "rule " << rule.name << "\n";
    out << "  command = " << rule.command << "\n";
    if (!rule.description.empty()) out << "  description = " << rule.description << "\n";
    if (!rule.depfile.empty()) out << "  depfile = " << rule.depfile << "\n";
    if (!rule.deps.empty()) out << "  deps = " << rule.deps << "\n";
    out << "\n";
}

void write_statement(std::ostringstream& out, const BuildStatement& statement) {
    out << "build";
    write_paths(out, statement.outputs);
    out << ": " << statement.rule;
    write_paths(out, statement.inputs);
    if (!statement.implicit_inputs.empty()) {
        out << " |";
        write_paths(out, statement.implicit_inputs);
    }
    if (!statement.order_only.empty()) {
        out << " ||";
        write_paths(out, statement.order_only);
    }
    out << "\n";
    for (const auto& var : statement.variables) {
        out << "  " << var.first << " = " << ninja_escape_value(var.second) << "\n";
    }
}

} // namespace

std::string ninja_escape_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());
    for (char c : path) {
        if (c == '$' || c == ' ' || c == ':') result += '$';
        result += c;
    }
    return result;
}

std::string ninja_escape_value(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c == '$') result += '$';
        result += c;
    }
    return result;
}

std::string NinjaGenerator::render(const Workspace& workspace) {
    const BuildGraph& graph = workspace.graph;
    std::ostringstream out;

    out << "# Generated by cbpgen from project '" << workspace.project.title << "'\n";
    out << "ninja_required_version = " << REQUIRED_NINJA_VERSION << "\n\n";

    for (const auto& rule : graph.rules()) {
        write_rule(out, rule);
    }

    // Statements grouped per target in build order, aliases last
    std::vector<const BuildStatement*> aliases;
    for (const auto& statement : graph.statements()) {
        if (statement.rule == "phony") {
            aliases.push_back(&statement);
            continue;
        }
        write_statement(out, statement);
        if (!statement.variables.empty()) out << "\n";
    }
    out << "\n";

    for (const BuildStatement* alias : aliases) {
        write_statement(out, *alias);
    }
    if (!aliases.empty()) out << "\n";

    if (!graph.defaults().empty()) {
        out << "default";
        write_paths(out, graph.defaults());
        out << "\n";
    }
    return out.str();
}

std::vector<GeneratedFile> NinjaGenerator::generate(const Workspace& workspace, const GeneratorOptions& /*options*/) {
    GeneratedFile file;
    file.path = "build.ninja";
    file.content = render(workspace);
    return {file};
}

REGISTER_GENERATOR(NinjaGenerator, "ninja");

} // namespace cbp
