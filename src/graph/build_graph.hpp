#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cbp {

// Command template shared by build statements. Commands use the build
// executor's variable syntax ($in, $out, $flags).
struct BuildRule {
    std::string name;
    std::string command;
    std::string description;
    std::string depfile;            // "$out.d" for compiler-emitted header dependencies
    std::string deps;               // "gcc" when depfile is set

    bool operator==(const BuildRule& other) const {
        return name == other.name && command == other.command && description == other.description &&
               depfile == other.depfile && deps == other.deps;
    }
};

// One edge of the build graph
struct BuildStatement {
    std::vector<std::string> outputs;
    std::string rule;                       // Rule name or "phony"
    std::vector<std::string> inputs;        // Explicit inputs ($in)
    std::vector<std::string> implicit_inputs;
    std::vector<std::string> order_only;
    std::vector<std::pair<std::string, std::string>> variables;

    // Value of a statement variable, "" if unset
    std::string variable(const std::string& name) const;
};

// Literal compiler invocation of one source, kept for the compilation database
struct CompileCommand {
    std::string target;
    std::string source;
    std::string object;
    std::vector<std::string> arguments;
};

class BuildGraph {
public:
    // Register a rule. Registering the same rule twice is a no-op; a different
    // rule under an existing name is a logic error.
    void add_rule(const BuildRule& rule);

    // Register a rule whose name is only a hint. An identical rule under the
    // name (or a numbered variant of it) is reused, otherwise the first free
    // numbered name is taken. Returns the name the rule was registered under.
    std::string add_unique_rule(BuildRule rule);

    const BuildRule* find_rule(const std::string& name) const;

    // Add a statement. Returns false when an equivalent statement already
    // produces the same outputs (the existing one is shared). Throws
    // PathMappingError when an output is already produced differently.
    bool add_statement(const BuildStatement& statement);

    // Statement producing a path, nullptr if none
    const BuildStatement* find_producer(const std::string& output) const;

    // True if any statement reads or writes the path
    bool references(const std::string& path) const;

    void add_default(const std::string& output);

    void add_compile_command(const CompileCommand& command) { compile_commands_.push_back(command); }

    const std::vector<BuildRule>& rules() const { return rules_; }
    const std::vector<BuildStatement>& statements() const { return statements_; }
    const std::vector<std::string>& defaults() const { return defaults_; }
    const std::vector<CompileCommand>& compile_commands() const { return compile_commands_; }

private:
    bool equivalent(const BuildStatement& a, const BuildStatement& b) const;

    std::vector<BuildRule> rules_;
    std::vector<BuildStatement> statements_;
    std::map<std::string, size_t> producers_;      // output -> statement index
    std::vector<std::string> defaults_;
    std::vector<CompileCommand> compile_commands_;
};

} // namespace cbp
