#include "pch.h"
#include "graph_synthesizer.hpp"
#include "common/path_utils.hpp"
#include "parsers/project_model_builder.hpp"

namespace cbp {

namespace {

std::string join(const std::vector<std::string>& values, const std::string& sep = " ") {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) result += sep;
        result += values[i];
    }
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

BuildRule make_rule(const std::string& name, const std::string& command, const std::string& description,
                    bool with_depfile) {
    BuildRule rule;
    rule.name = name;
    rule.command = command;
    rule.description = description;
    if (with_depfile) {
        rule.depfile = "$out.d";
        rule.deps = "gcc";
    }
    return rule;
}

std::vector<std::string> quoted(const std::vector<std::string>& args) {
    std::vector<std::string> result;
    for (const auto& arg : args) {
        result.push_back(quote_argument(arg));
    }
    return result;
}

std::string archive_command(const std::string& ar) {
#ifdef _WIN32
    return "cmd /c (if exist \"$out\" del /q \"$out\") & " + ar + " crs $out $in";
#else
    return "rm -f $out && " + ar + " crs $out $in";
#endif
}

} // namespace

std::string custom_build_output(const std::string& command, const std::string& fallback) {
    auto tokens = split_command_line(command);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == "-o") return to_unix_path(tokens[i + 1]);
    }
    return fallback;
}

std::string escape_command_text(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '$') result += '$';
        result += c;
    }
    return result;
}

std::string sanitize_rule_token(const std::string& text) {
    std::string result = text;
    for (auto& c : result) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return result;
}

std::string GraphSynthesizer::expand_custom_command(const TargetPlan& plan, const ClassifiedSource& entry) const {
    CompilerFlagAnalyzer analyzer(diag_);
    std::vector<std::string> includes;
    for (const auto& dir : analyzer.include_dirs_for(plan.options, *entry.source)) {
        includes.push_back(quote_argument("-I" + dir));
    }

    std::string command = make_target_macros(project_, *plan.target).expand(entry.custom_build->command);
    replace_all(command, "$compiler", quote_argument(plan.tools.cc));
    replace_all(command, "$options", join(analyzer.flags_for(plan.options, *entry.source)));
    replace_all(command, "$includes", join(includes));
    replace_all(command, "$object", entry.object);
    replace_all(command, "$file", entry.source->path);
    return command;
}

void GraphSynthesizer::add_compile_statement(BuildGraph& graph, const TargetPlan& plan,
                                             const ClassifiedSource& entry, TargetOutputs& outputs) {
    const std::string suffix = plan.options.profile.rule_suffix();
    const std::string cc = quote_argument(plan.tools.cc);

    std::string tool = plan.tools.cc;
    BuildRule rule;
    switch (entry.kind) {
        case SourceKind::C:
            rule = make_rule("cc_" + suffix, cc + " $flags -MMD -MF $out.d -c $in -o $out", "CC $out", true);
            break;
        case SourceKind::Cxx:
            tool = plan.tools.cxx;
            outputs.uses_cxx = true;
            rule = make_rule("cxx_" + suffix, quote_argument(tool) + " $flags -MMD -MF $out.d -c $in -o $out",
                             "CXX $out", true);
            break;
        case SourceKind::PreprocessedAssembly:
            rule = make_rule("asmpp_" + suffix, cc + " $flags -MMD -MF $out.d -c $in -o $out", "AS $out", true);
            break;
        case SourceKind::Assembly:
            rule = make_rule("asm_" + suffix, cc + " $flags -c $in -o $out", "AS $out", false);
            break;
        default:
            return;
    }
    graph.add_rule(rule);

    CompilerFlagAnalyzer analyzer(diag_);
    std::vector<std::string> flags = analyzer.flags_for(plan.options, *entry.source);
    std::vector<std::string> include_dirs = analyzer.include_dirs_for(plan.options, *entry.source);

    std::vector<std::string> flag_values = flags;
    for (const auto& dir : include_dirs) {
        flag_values.push_back(quote_argument("-I" + dir));
    }

    BuildStatement statement;
    statement.outputs = {entry.object};
    statement.rule = rule.name;
    statement.inputs = {entry.source->path};
    if (!flag_values.empty()) {
        statement.variables.emplace_back("flags", join(flag_values));
    }
    graph.add_statement(statement);

    CompileCommand command;
    command.target = plan.target->name;
    command.source = entry.source->path;
    command.object = entry.object;
    command.arguments.push_back(tool);
    for (const auto& flag : flags) {
        for (const auto& token : split_command_line(flag)) {
            command.arguments.push_back(token);
        }
    }
    for (const auto& dir : include_dirs) {
        command.arguments.push_back("-I" + dir);
    }
    command.arguments.insert(command.arguments.end(), {"-c", entry.source->path, "-o", entry.object});
    graph.add_compile_command(command);

    if (entry.source->link) {
        outputs.linked.push_back(entry.object);
    } else {
        outputs.built_only.push_back(entry.object);
    }
}

void GraphSynthesizer::add_special_statement(BuildGraph& graph, const TargetPlan& plan,
                                             const ClassifiedSource& entry, TargetOutputs& outputs) {
    std::string command = trim(expand_custom_command(plan, entry));
    if (command.empty()) {
        diag_.warn("Unit '" + entry.source->path + "': custom build command is blank for target '" +
                   plan.target->name + "', no statement generated");
        return;
    }

    std::string output = normalize_path(custom_build_output(command, entry.object));

    BuildRule rule = make_rule("special_" + sanitize_rule_token(plan.target->name + "_" + entry.source->path),
                               escape_command_text(command), "CUSTOM $out", false);

    BuildStatement statement;
    statement.outputs = {output};
    statement.rule = graph.add_unique_rule(rule);
    statement.inputs = {entry.source->path};
    graph.add_statement(statement);

    CompileCommand compile;
    compile.target = plan.target->name;
    compile.source = entry.source->path;
    compile.object = output;
    compile.arguments = split_command_line(command);
    graph.add_compile_command(compile);

    outputs.built_only.push_back(output);
}

void GraphSynthesizer::add_link_statement(BuildGraph& graph, const TargetPlan& plan, const TargetOutputs& outputs) {
    const Target& target = *plan.target;
    if (outputs.linked.empty()) {
        diag_.warn("Target '" + target.name + "' has no objects to link, no link statement generated");
        return;
    }

    const std::string suffix = plan.options.profile.rule_suffix();
    const std::string driver = quote_argument(outputs.uses_cxx ? plan.tools.cxx : plan.tools.cc);
    const std::string xx = outputs.uses_cxx ? "xx" : "";

    BuildStatement statement;
    statement.outputs = {target.output};
    statement.inputs = outputs.linked;
    statement.implicit_inputs = outputs.built_only;

    if (target.is_static_library()) {
        BuildRule rule = make_rule("ar_" + suffix, archive_command(quote_argument(plan.tools.ar)), "AR $out", false);
        graph.add_rule(rule);
        statement.rule = rule.name;
        statement.implicit_inputs.insert(statement.implicit_inputs.end(),
                                         target.external_deps.begin(), target.external_deps.end());
        if (!plan.link.libraries.empty()) {
            log::debug("target '" + target.name + "': libraries are not archived into a static library");
        }
    } else {
        BuildRule rule;
        if (target.is_dynamic_library()) {
            rule = make_rule("so" + xx + "_" + suffix, driver + " -shared $pre_flags $in $lib_flags -o $out",
                             "LINK $out", false);
        } else if (plan.link.linker_type == LinkerType::Ld) {
            rule = make_rule("ld_" + suffix, quote_argument(plan.tools.ld) + " $pre_flags $in $lib_flags -o $out",
                             "LINK $out", false);
        } else {
            rule = make_rule("link" + xx + "_" + suffix, driver + " $pre_flags $in $lib_flags -o $out",
                             "LINK $out", false);
        }
        graph.add_rule(rule);
        statement.rule = rule.name;
        statement.implicit_inputs.insert(statement.implicit_inputs.end(),
                                         plan.link.implicit_inputs.begin(), plan.link.implicit_inputs.end());

        if (!plan.link.pre_flags.empty()) {
            statement.variables.emplace_back("pre_flags", join(quoted(plan.link.pre_flags)));
        }
        std::vector<std::string> lib_flags = plan.link.lib_flags();
        if (!lib_flags.empty()) {
            statement.variables.emplace_back("lib_flags", join(quoted(lib_flags)));
        }
    }

    statement.implicit_inputs = dedupe_preserving_order(statement.implicit_inputs);
    graph.add_statement(statement);

    if (target.name != target.output && !graph.find_producer(target.name)) {
        BuildStatement alias;
        alias.outputs = {target.name};
        alias.rule = "phony";
        alias.inputs = {target.output};
        graph.add_statement(alias);
    }
}

BuildGraph GraphSynthesizer::synthesize(const std::vector<TargetPlan>& plans, const std::string& active_target) {
    BuildGraph graph;

    for (const auto& plan : plans) {
        const Target& target = *plan.target;
        if (!target.is_buildable()) {
            log::debug("target '" + target.name + "' runs commands only, no build statements");
            continue;
        }

        TargetOutputs outputs;
        for (const auto& entry : plan.sources) {
            if (entry.kind == SourceKind::Ignored) continue;
            if (entry.kind == SourceKind::Special) {
                add_special_statement(graph, plan, entry, outputs);
            } else {
                add_compile_statement(graph, plan, entry, outputs);
            }
        }

        add_link_statement(graph, plan, outputs);
    }

    if (!active_target.empty()) {
        const Target* target = project_.find_target(active_target);
        if (target && graph.find_producer(target->output)) {
            graph.add_default(target->output);
        } else {
            diag_.warn("Active target '" + active_target + "' produces no output, no default build target");
        }
    }

    log::debug("build graph: " + std::to_string(graph.rules().size()) + " rules, " +
               std::to_string(graph.statements().size()) + " statements");
    return graph;
}

} // namespace cbp
