#include "pch.h"
#include "build_graph.hpp"

namespace cbp {

std::string BuildStatement::variable(const std::string& name) const {
    for (const auto& var : variables) {
        if (var.first == name) return var.second;
    }
    return "";
}

void BuildGraph::add_rule(const BuildRule& rule) {
    if (const BuildRule* existing = find_rule(rule.name)) {
        if (*existing == rule) return;
        throw std::logic_error("Conflicting definitions for build rule '" + rule.name + "'");
    }
    rules_.push_back(rule);
}

std::string BuildGraph::add_unique_rule(BuildRule rule) {
    const std::string base = rule.name;
    for (int n = 2;; ++n) {
        const BuildRule* existing = find_rule(rule.name);
        if (!existing) break;
        if (*existing == rule) return rule.name;
        rule.name = base + "_" + std::to_string(n);
    }
    rules_.push_back(rule);
    return rule.name;
}

const BuildRule* BuildGraph::find_rule(const std::string& name) const {
    for (const auto& rule : rules_) {
        if (rule.name == name) return &rule;
    }
    return nullptr;
}

bool BuildGraph::equivalent(const BuildStatement& a, const BuildStatement& b) const {
    if (a.outputs != b.outputs || a.inputs != b.inputs || a.implicit_inputs != b.implicit_inputs ||
        a.order_only != b.order_only || a.variables != b.variables) {
        return false;
    }
    if (a.rule == b.rule) return true;

    const BuildRule* rule_a = find_rule(a.rule);
    const BuildRule* rule_b = find_rule(b.rule);
    return rule_a && rule_b && rule_a->command == rule_b->command && rule_a->depfile == rule_b->depfile;
}

bool BuildGraph::add_statement(const BuildStatement& statement) {
    for (const auto& output : statement.outputs) {
        auto it = producers_.find(output);
        if (it == producers_.end()) continue;

        const BuildStatement& existing = statements_[it->second];
        if (equivalent(existing, statement)) {
            log::debug("'" + output + "' already produced by an identical statement, shared");
            return false;
        }
        throw PathMappingError("'" + output + "' would be produced by two different build statements (rules '" +
                               existing.rule + "' and '" + statement.rule + "')");
    }

    for (const auto& output : statement.outputs) {
        producers_[output] = statements_.size();
    }
    statements_.push_back(statement);
    return true;
}

const BuildStatement* BuildGraph::find_producer(const std::string& output) const {
    auto it = producers_.find(output);
    return it == producers_.end() ? nullptr : &statements_[it->second];
}

bool BuildGraph::references(const std::string& path) const {
    auto contains = [&](const std::vector<std::string>& values) {
        return std::find(values.begin(), values.end(), path) != values.end();
    };
    for (const auto& statement : statements_) {
        if (contains(statement.outputs) || contains(statement.inputs) ||
            contains(statement.implicit_inputs) || contains(statement.order_only)) {
            return true;
        }
    }
    return false;
}

void BuildGraph::add_default(const std::string& output) {
    if (std::find(defaults_.begin(), defaults_.end(), output) == defaults_.end()) {
        defaults_.push_back(output);
    }
}

} // namespace cbp
