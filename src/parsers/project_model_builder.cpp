#include "pch.h"
#include "project_model_builder.hpp"

namespace cbp {

namespace {

constexpr const char* DEFAULT_PROJECT_TITLE = "untitled";

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Code::Blocks stores multi-line build commands with literal "\n" separators
std::string join_command_lines(const std::string& raw) {
    std::string text = raw;
    size_t pos = 0;
    while ((pos = text.find("\\n", pos)) != std::string::npos) {
        text.replace(pos, 2, "\n");
        ++pos;
    }

    std::string result;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (!result.empty()) result += " && ";
        result += line;
    }
    return result;
}

std::vector<std::string> split_list(const std::string& value, char sep) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, sep)) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // namespace

std::vector<std::string> merge_by_relation(const std::vector<std::string>& project_values,
                                           const std::vector<std::string>& target_values,
                                           OptionsRelation relation) {
    std::vector<std::string> result;
    switch (relation) {
        case OptionsRelation::ProjectOnly:
            result = project_values;
            break;
        case OptionsRelation::TargetOnly:
            result = target_values;
            break;
        case OptionsRelation::TargetFirst:
            result = target_values;
            result.insert(result.end(), project_values.begin(), project_values.end());
            break;
        case OptionsRelation::ProjectFirst:
        default:
            result = project_values;
            result.insert(result.end(), target_values.begin(), target_values.end());
            break;
    }
    return result;
}

MacroTable make_target_macros(const ProjectInfo& project, const Target& target) {
    MacroTable macros;
    macros.set("PROJECT_NAME", project.title);
    macros.set("PROJECTNAME", project.title);
    macros.set("PROJECT_DIR", "./");
    macros.set("PROJECTDIR", "./");
    macros.set("TARGET_NAME", target.name);

    if (!target.object_output.empty()) {
        macros.set("TARGET_OBJECT_DIR", target.object_output + "/");
    }
    if (!target.output.empty()) {
        std::string out_dir = parent_path(target.output);
        std::string base = file_name(target.output);
        std::string ext = file_extension(base);
        macros.set("TARGET_OUTPUT_DIR", out_dir.empty() ? "./" : out_dir + "/");
        macros.set("TARGET_OUTPUT_FILE", target.output);
        macros.set("TARGET_OUTPUT_BASENAME", base.substr(0, base.size() - ext.size()));
    }
    return macros;
}

ProjectModelBuilder::ScopeSettings ProjectModelBuilder::read_scope(const RawElement& element) {
    ScopeSettings scope;

    if (const std::string* compiler = element.option("compiler")) {
        scope.compiler_id = *compiler;
    }

    if (const RawElement* compiler = element.child("Compiler")) {
        for (const RawElement* add : compiler->children_named("Add")) {
            if (const std::string* opt = add->attribute("option")) {
                std::string value = trim(*opt);
                if (!value.empty()) scope.compiler_options.push_back(value);
            }
            if (const std::string* dir = add->attribute("directory")) {
                std::string value = trim(*dir);
                if (!value.empty()) scope.include_dirs.push_back(to_unix_path(value));
            }
        }
    }

    if (const RawElement* linker = element.child("Linker")) {
        for (const RawElement* add : linker->children_named("Add")) {
            if (const std::string* opt = add->attribute("option")) {
                std::string value = trim(*opt);
                if (!value.empty()) scope.linker_options.push_back(value);
            }
            if (const std::string* lib = add->attribute("library")) {
                std::string value = trim(*lib);
                if (!value.empty()) scope.libraries.push_back(value);
            }
            if (const std::string* dir = add->attribute("directory")) {
                std::string value = trim(*dir);
                if (!value.empty()) scope.library_dirs.push_back(to_unix_path(value));
            }
        }
    }

    if (const RawElement* extra = element.child("ExtraCommands")) {
        for (const RawElement* add : extra->children_named("Add")) {
            if (const std::string* before = add->attribute("before")) {
                std::string value = trim(*before);
                if (!value.empty()) scope.commands.before.push_back(value);
            }
            if (const std::string* after = add->attribute("after")) {
                std::string value = trim(*after);
                if (!value.empty()) scope.commands.after.push_back(value);
            }
        }
    }

    return scope;
}

OptionsRelation ProjectModelBuilder::read_relation(const RawElement& element, const std::string& key,
                                                   const std::string& target_name) {
    const std::string* value = element.option(key);
    if (!value) return OptionsRelation::ProjectFirst;

    if (*value == "0") return OptionsRelation::ProjectOnly;
    if (*value == "1") return OptionsRelation::TargetOnly;
    if (*value == "2") return OptionsRelation::TargetFirst;
    if (*value == "3") return OptionsRelation::ProjectFirst;

    diag_.warn("Target '" + target_name + "': invalid " + key + " '" + *value +
               "', using project-then-target order");
    return OptionsRelation::ProjectFirst;
}

std::string ProjectModelBuilder::resolve_output(const RawElement& element, Target& target) {
    const std::string* declared = element.option("output");
    if (!declared || trim(*declared).empty()) {
        throw SemanticModelError("Target '" + target.name + "' declares no output file (<Option output>)");
    }

    std::string output = to_unix_path(trim(*declared));
    std::string name = file_name(output);
    std::string dir = parent_path(output);
    std::string ext = file_extension(name);

    bool extension_auto = element.option("extension_auto") && *element.option("extension_auto") == "1";
    bool prefix_auto = !element.option("prefix_auto") || *element.option("prefix_auto") != "0";

    if (extension_auto && ext.empty()) {
        if (target.is_static_library()) {
            name += ".a";
        } else if (target.is_dynamic_library()) {
            name += ".so";
        }
    }

    if (target.is_static_library() && prefix_auto && name.compare(0, 3, "lib") != 0) {
        name = "lib" + name;
    }

    return dir.empty() ? name : dir + "/" + name;
}

Target ProjectModelBuilder::build_target(const RawElement& element, const ProjectInfo& project,
                                         const ScopeSettings& project_scope) {
    Target target;
    target.name = element.attribute_or("title");

    ScopeSettings scope = read_scope(element);
    target.compiler_id = scope.compiler_id.empty() ? project_scope.compiler_id : scope.compiler_id;

    const std::string* declared_output = element.option("output");
    if (const std::string* type = element.option("type")) {
        if (*type == "0") target.type = TargetType::GuiApplication;
        else if (*type == "1") target.type = TargetType::ConsoleApplication;
        else if (*type == "2") target.type = TargetType::StaticLibrary;
        else if (*type == "3") target.type = TargetType::DynamicLibrary;
        else if (*type == "4") target.type = TargetType::CommandsOnly;
        else diag_.warn("Target '" + target.name + "': unknown type '" + *type + "'");
    } else if (declared_output && file_extension(*declared_output) == ".a") {
        target.type = TargetType::StaticLibrary;
    }

    if (const std::string* dir = element.option("working_dir")) {
        target.working_dir = to_unix_path(trim(*dir));
    }
    if (const std::string* deps = element.option("external_deps")) {
        for (const auto& dep : split_list(*deps, ';')) {
            target.external_deps.push_back(to_unix_path(dep));
        }
    }

    // Output and object directory are unset yet, so only the names expand
    MacroTable names = make_target_macros(project, target);

    std::string object_output = "obj/" + target.name;
    if (const std::string* obj = element.option("object_output")) {
        if (!trim(*obj).empty()) object_output = trim(*obj);
    }
    target.object_output = strip_trailing_separators(normalize_path(names.expand(object_output)));

    if (target.is_buildable()) {
        target.output = normalize_path(names.expand(resolve_output(element, target)));
    } else if (declared_output && !trim(*declared_output).empty()) {
        target.output = normalize_path(names.expand(to_unix_path(trim(*declared_output))));
    }

    OptionsRelation compiler_rel = read_relation(element, "projectCompilerOptionsRelation", target.name);
    OptionsRelation linker_rel = read_relation(element, "projectLinkerOptionsRelation", target.name);
    OptionsRelation include_rel = read_relation(element, "projectIncludeDirsRelation", target.name);
    OptionsRelation libdir_rel = read_relation(element, "projectLibDirsRelation", target.name);

    target.compiler_options = merge_by_relation(project_scope.compiler_options, scope.compiler_options, compiler_rel);
    target.linker_options = merge_by_relation(project_scope.linker_options, scope.linker_options, linker_rel);
    target.include_dirs = merge_by_relation(project_scope.include_dirs, scope.include_dirs, include_rel);
    target.library_dirs = merge_by_relation(project_scope.library_dirs, scope.library_dirs, libdir_rel);

    // Libraries follow the linker relation for inclusion, but always keep
    // project-before-target order
    if (linker_rel != OptionsRelation::TargetOnly) {
        target.project_libraries = project_scope.libraries;
    }
    if (linker_rel != OptionsRelation::ProjectOnly) {
        target.target_libraries = scope.libraries;
    }

    target.commands.before = project_scope.commands.before;
    target.commands.before.insert(target.commands.before.end(),
                                  scope.commands.before.begin(), scope.commands.before.end());
    target.commands.after = scope.commands.after;
    target.commands.after.insert(target.commands.after.end(),
                                 project_scope.commands.after.begin(), project_scope.commands.after.end());

    expand_placeholders(target, project);

    log::debug("target '" + target.name + "' (" + target_type_to_string(target.type) + "): output=" +
               target.output + " objects=" + target.object_output + " compiler=" + target.compiler_id);
    return target;
}

void ProjectModelBuilder::expand_placeholders(Target& target, const ProjectInfo& project) {
    MacroTable macros = make_target_macros(project, target);

    target.working_dir = macros.expand(target.working_dir);
    target.compiler_options = macros.expand_all(target.compiler_options);
    target.linker_options = macros.expand_all(target.linker_options);
    target.include_dirs = macros.expand_all(target.include_dirs);
    target.library_dirs = macros.expand_all(target.library_dirs);
    target.project_libraries = macros.expand_all(target.project_libraries);
    target.target_libraries = macros.expand_all(target.target_libraries);
    target.external_deps = macros.expand_all(target.external_deps);
    target.commands.before = macros.expand_all(target.commands.before);
    target.commands.after = macros.expand_all(target.commands.after);
}

SourceFile ProjectModelBuilder::build_source(const RawElement& unit, const ProjectInfo& project) {
    SourceFile source;
    source.path = to_unix_path(trim(unit.attribute_or("filename")));

    for (const RawElement* option : unit.children_named("Option")) {
        if (const std::string* target = option->attribute("target")) {
            if (!project.find_target(*target)) {
                diag_.warn("Unit '" + source.path + "' refers to unknown target '" + *target + "'");
            }
            source.targets.push_back(*target);
        }
        if (const std::string* compile = option->attribute("compile")) {
            source.compile = *compile != "0";
        }
        if (const std::string* link = option->attribute("link")) {
            source.link = *link != "0";
        }

        const std::string* compiler = option->attribute("compiler");
        const std::string* build_command = option->attribute("buildCommand");
        if (compiler && build_command && option->attribute_or("use", "0") == "1") {
            std::string command = join_command_lines(*build_command);
            if (command.empty()) {
                diag_.warn("Unit '" + source.path + "' has an empty build command for compiler '" +
                           *compiler + "', ignored");
            } else {
                source.custom_builds.push_back({*compiler, command});
            }
        }
    }

    if (const RawElement* compiler = unit.child("Compiler")) {
        for (const RawElement* add : compiler->children_named("Add")) {
            if (const std::string* opt = add->attribute("option")) {
                std::string value = trim(*opt);
                if (!value.empty()) source.compiler_options.push_back(value);
            }
            if (const std::string* dir = add->attribute("directory")) {
                std::string value = trim(*dir);
                if (!value.empty()) source.include_dirs.push_back(to_unix_path(value));
            }
        }
    }

    return source;
}

ProjectInfo ProjectModelBuilder::build(const CbpDocument& doc) {
    const RawElement& root = doc.project;
    ProjectInfo project;

    if (const std::string* title = root.option("title")) {
        project.title = *title;
    }
    if (project.title.empty()) {
        diag_.warn("Project has no title, using '" + std::string(DEFAULT_PROJECT_TITLE) + "'");
        project.title = DEFAULT_PROJECT_TITLE;
    }

    ScopeSettings project_scope = read_scope(root);
    project.compiler_id = project_scope.compiler_id;
    project.compiler_options = project_scope.compiler_options;
    project.include_dirs = project_scope.include_dirs;
    project.linker_options = project_scope.linker_options;
    project.library_dirs = project_scope.library_dirs;
    project.linker_libraries = project_scope.libraries;
    project.commands = project_scope.commands;

    log::debug("project '" + project.title + "', compiler " +
               (project.compiler_id.empty() ? std::string("<per target>") : project.compiler_id));

    // Targets in document order; a repeated title replaces the earlier definition
    for (const RawElement* build : root.children_named("Build")) {
        for (const RawElement* element : build->children_named("Target")) {
            Target target = build_target(*element, project, project_scope);

            auto existing = std::find_if(project.targets.begin(), project.targets.end(),
                                         [&](const Target& t) { return t.name == target.name; });
            if (existing != project.targets.end()) {
                diag_.warn("Duplicate target '" + target.name + "', the last definition wins");
                *existing = std::move(target);
            } else {
                project.targets.push_back(std::move(target));
            }
        }
    }

    if (project.targets.empty()) {
        throw SemanticModelError("Project '" + project.title + "' defines no targets");
    }

    for (const RawElement* unit : root.children_named("Unit")) {
        if (!unit->has_attribute("filename") || trim(unit->attribute_or("filename")).empty()) {
            diag_.warn("<Unit> without filename ignored");
            continue;
        }
        SourceFile source = build_source(*unit, project);

        auto existing = std::find_if(project.sources.begin(), project.sources.end(),
                                     [&](const SourceFile& s) { return s.path == source.path; });
        if (existing != project.sources.end()) {
            diag_.warn("Duplicate unit '" + source.path + "', the last definition wins");
            *existing = std::move(source);
        } else {
            project.sources.push_back(std::move(source));
        }
    }

    if (project.sources.empty()) {
        throw SemanticModelError("Project '" + project.title + "' contains no source files (<Unit>)");
    }

    return project;
}

} // namespace cbp
