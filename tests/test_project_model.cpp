#include "test_support.hpp"

using namespace cbp;
using namespace cbp::test;

class ProjectModelTest : public ::testing::Test {
protected:
    ProjectInfo build(const std::string& body) {
        return build_project(cbp_project(body), diag);
    }

    Diagnostics diag;
};

// Project flags -Da, target flags -Db, relation given by the caller
static std::string relation_body(const std::string& relation) {
    std::string option = relation.empty()
                             ? std::string()
                             : "<Option projectCompilerOptionsRelation=\"" + relation + "\" />";
    return R"(
        <Option title="rel" />
        <Option compiler="riscv32-v2" />
        <Compiler><Add option="-Da" /></Compiler>
        <Build>
          <Target title="T">
            <Option output="t.elf" />
            )" + option + R"(
            <Compiler><Add option="-Db" /></Compiler>
          </Target>
        </Build>
        <Unit filename="main.c" />)";
}

TEST_F(ProjectModelTest, CompilerOptionsRelations) {
    using Flags = std::vector<std::string>;

    EXPECT_EQ(build(relation_body("0")).targets[0].compiler_options, (Flags{"-Da"}));
    EXPECT_EQ(build(relation_body("1")).targets[0].compiler_options, (Flags{"-Db"}));
    EXPECT_EQ(build(relation_body("2")).targets[0].compiler_options, (Flags{"-Db", "-Da"}));
    EXPECT_EQ(build(relation_body("3")).targets[0].compiler_options, (Flags{"-Da", "-Db"}));
    EXPECT_EQ(build(relation_body("")).targets[0].compiler_options, (Flags{"-Da", "-Db"}));
}

TEST_F(ProjectModelTest, InvalidRelationFallsBackWithWarning) {
    ProjectInfo project = build(relation_body("7"));
    EXPECT_EQ(project.targets[0].compiler_options, (std::vector<std::string>{"-Da", "-Db"}));
    EXPECT_TRUE(diag.contains("invalid projectCompilerOptionsRelation"));
}

TEST_F(ProjectModelTest, OutputIsTakenLiterally) {
    ProjectInfo project = build(R"(
        <Option title="app" />
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug">
            <Option output="build/out/app.elf" />
            <Option type="1" />
          </Target>
        </Build>
        <Unit filename="main.c" />)");

    ASSERT_EQ(project.targets.size(), 1u);
    EXPECT_EQ(project.targets[0].output, "build/out/app.elf");
    EXPECT_EQ(project.targets[0].type, TargetType::ConsoleApplication);
}

TEST_F(ProjectModelTest, MissingOutputIsSemanticError) {
    try {
        build(R"(
            <Option compiler="riscv32-v2" />
            <Build><Target title="Debug"><Option type="1" /></Target></Build>
            <Unit filename="main.c" />)");
        FAIL() << "expected SemanticModelError";
    } catch (const SemanticModelError& e) {
        EXPECT_EQ(e.stage(), "model");
        EXPECT_TRUE(contains_text(e.what(), "Debug"));
    }
}

TEST_F(ProjectModelTest, CommandsOnlyTargetNeedsNoOutput) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Flash">
            <Option type="4" />
            <ExtraCommands><Add after="flash.sh" /></ExtraCommands>
          </Target>
        </Build>
        <Unit filename="main.c" />)");

    ASSERT_EQ(project.targets.size(), 1u);
    EXPECT_FALSE(project.targets[0].is_buildable());
    EXPECT_TRUE(project.targets[0].output.empty());
}

TEST_F(ProjectModelTest, StaticLibraryNaming) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Auto">
            <Option output="out/mylib" />
            <Option type="2" />
            <Option extension_auto="1" />
          </Target>
          <Target title="NoPrefix">
            <Option output="out/raw" />
            <Option type="2" />
            <Option extension_auto="1" />
            <Option prefix_auto="0" />
          </Target>
          <Target title="Explicit">
            <Option output="out/libdone.a" />
            <Option type="2" />
          </Target>
          <Target title="Inferred">
            <Option output="out/inferred.a" />
          </Target>
        </Build>
        <Unit filename="lib.c" />)");

    EXPECT_EQ(project.find_target("Auto")->output, "out/libmylib.a");
    EXPECT_EQ(project.find_target("NoPrefix")->output, "out/raw.a");
    EXPECT_EQ(project.find_target("Explicit")->output, "out/libdone.a");

    const Target* inferred = project.find_target("Inferred");
    EXPECT_TRUE(inferred->is_static_library());
    EXPECT_EQ(inferred->output, "out/libinferred.a");
}

TEST_F(ProjectModelTest, ObjectDirectoryDefaultsPerTarget) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug"><Option output="a.elf" /></Target>
          <Target title="Release">
            <Option output="b.elf" />
            <Option object_output="build/rel/obj/" />
          </Target>
        </Build>
        <Unit filename="main.c" />)");

    EXPECT_EQ(project.find_target("Debug")->object_output, "obj/Debug");
    EXPECT_EQ(project.find_target("Release")->object_output, "build/rel/obj");
}

TEST_F(ProjectModelTest, PlaceholdersAreExpanded) {
    ProjectInfo project = build(R"xml(
        <Option title="blinky" />
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug">
            <Option output="bin/$(TARGET_NAME)/$(PROJECT_NAME).elf" />
            <Option object_output="obj/${TARGET_NAME}" />
            <Compiler>
              <Add option="-DOUT=$(TARGET_OUTPUT_BASENAME)" />
              <Add option="-DHOME=$(SOME_UNKNOWN_MACRO)" />
            </Compiler>
            <ExtraCommands>
              <Add before="mkdir -p $(TARGET_OBJECT_DIR)" />
              <Add after="size $(TARGET_OUTPUT_FILE)" />
            </ExtraCommands>
          </Target>
        </Build>
        <Unit filename="main.c" />)xml");

    const Target& target = project.targets[0];
    EXPECT_EQ(target.output, "bin/Debug/blinky.elf");
    EXPECT_EQ(target.object_output, "obj/Debug");
    EXPECT_TRUE(contains(target.compiler_options, "-DOUT=blinky"));
    EXPECT_TRUE(contains(target.compiler_options, "-DHOME=$(SOME_UNKNOWN_MACRO)"));
    EXPECT_EQ(target.commands.before, (std::vector<std::string>{"mkdir -p obj/Debug/"}));
    EXPECT_EQ(target.commands.after, (std::vector<std::string>{"size bin/Debug/blinky.elf"}));
}

TEST_F(ProjectModelTest, TargetMacrosFollowResolvedPaths) {
    ProjectInfo info;
    info.title = "fw";
    Target target;
    target.name = "Debug";

    MacroTable names = make_target_macros(info, target);
    EXPECT_EQ(names.expand("$(PROJECT_DIR)obj/$(PROJECTNAME)_$(TARGET_NAME)"), "./obj/fw_Debug");
    EXPECT_EQ(names.expand("$(TARGET_OUTPUT_DIR)x"), "$(TARGET_OUTPUT_DIR)x");

    target.output = "bin/fw.elf";
    target.object_output = "obj/Debug";
    MacroTable full = make_target_macros(info, target);
    EXPECT_EQ(full.expand("$(TARGET_OUTPUT_DIR)$(TARGET_OUTPUT_BASENAME).map"), "bin/fw.map");
    EXPECT_EQ(full.expand("$(TARGET_OBJECT_DIR)"), "obj/Debug/");

    ProjectInfo project = build(R"xml(
        <Option title="blinky" />
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug">
            <Option output="$(PROJECT_DIR)bin/$(PROJECTNAME).elf" />
            <Option object_output="$(PROJECTDIR)obj/$(PROJECT_NAME)" />
          </Target>
        </Build>
        <Unit filename="main.c" />)xml");
    EXPECT_EQ(project.targets[0].output, "bin/blinky.elf");
    EXPECT_EQ(project.targets[0].object_output, "obj/blinky");
}

TEST_F(ProjectModelTest, DuplicateTargetLastDefinitionWins) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug"><Option output="first.elf" /></Target>
          <Target title="Release"><Option output="rel.elf" /></Target>
          <Target title="Debug"><Option output="second.elf" /></Target>
        </Build>
        <Unit filename="main.c" />)");

    ASSERT_EQ(project.targets.size(), 2u);
    EXPECT_EQ(project.targets[0].name, "Debug");
    EXPECT_EQ(project.targets[0].output, "second.elf");
    EXPECT_TRUE(diag.contains("Duplicate target 'Debug'"));
}

TEST_F(ProjectModelTest, UnitMembershipAndOptions) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build>
          <Target title="Debug"><Option output="d.elf" /></Target>
          <Target title="Release"><Option output="r.elf" /></Target>
        </Build>
        <Unit filename="src\main.c" />
        <Unit filename="src/trace.c">
          <Option target="Debug" />
          <Option target="Bogus" />
        </Unit>
        <Unit filename="res/blob.o">
          <Option compile="0" />
          <Option link="0" />
        </Unit>
        <Unit filename="src/hot.c">
          <Compiler>
            <Add option="-O3" />
            <Add directory="src/hot" />
          </Compiler>
        </Unit>)");

    ASSERT_EQ(project.sources.size(), 4u);
    EXPECT_EQ(project.sources[0].path, "src/main.c");
    EXPECT_TRUE(project.sources[0].applies_to("Release"));

    const SourceFile& trace = project.sources[1];
    EXPECT_TRUE(trace.applies_to("Debug"));
    EXPECT_FALSE(trace.applies_to("Release"));
    EXPECT_TRUE(diag.contains("unknown target 'Bogus'"));

    EXPECT_FALSE(project.sources[2].compile);
    EXPECT_FALSE(project.sources[2].link);

    EXPECT_EQ(project.sources[3].compiler_options, (std::vector<std::string>{"-O3"}));
    EXPECT_EQ(project.sources[3].include_dirs, (std::vector<std::string>{"src/hot"}));
}

TEST_F(ProjectModelTest, CustomBuildCommandLinesAreJoined) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build><Target title="Debug"><Option output="d.elf" /></Target></Build>
        <Unit filename="gen.c">
          <Option compiler="riscv32-v2" use="1" buildCommand="echo one\n  \necho two\n" />
          <Option compiler="riscv32-v1" use="0" buildCommand="never used" />
          <Option compiler="riscv32-v3" use="1" buildCommand="  \n " />
        </Unit>)");

    const SourceFile& unit = project.sources[0];
    ASSERT_EQ(unit.custom_builds.size(), 1u);
    EXPECT_EQ(unit.custom_builds[0].compiler_id, "riscv32-v2");
    EXPECT_EQ(unit.custom_builds[0].command, "echo one && echo two");
    EXPECT_TRUE(diag.contains("empty build command"));
}

TEST_F(ProjectModelTest, ExtraCommandsWrapTargetAroundProject) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <ExtraCommands>
          <Add before="project-pre" />
          <Add after="project-post" />
        </ExtraCommands>
        <Build>
          <Target title="Debug">
            <Option output="d.elf" />
            <ExtraCommands>
              <Add before="target-pre" />
              <Add after="target-post" />
            </ExtraCommands>
          </Target>
        </Build>
        <Unit filename="main.c" />)");

    const Target& target = project.targets[0];
    EXPECT_EQ(target.commands.before, (std::vector<std::string>{"project-pre", "target-pre"}));
    EXPECT_EQ(target.commands.after, (std::vector<std::string>{"target-post", "project-post"}));
}

TEST_F(ProjectModelTest, LibrariesKeptPerOrigin) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Linker>
          <Add library="a" />
          <Add directory="lib" />
        </Linker>
        <Build>
          <Target title="Debug">
            <Option output="d.elf" />
            <Linker>
              <Add library="b" />
              <Add option="-lc" />
            </Linker>
          </Target>
          <Target title="Bare">
            <Option output="bare.elf" />
            <Option projectLinkerOptionsRelation="1" />
          </Target>
        </Build>
        <Unit filename="main.c" />)");

    const Target* debug = project.find_target("Debug");
    EXPECT_EQ(debug->project_libraries, (std::vector<std::string>{"a"}));
    EXPECT_EQ(debug->target_libraries, (std::vector<std::string>{"b"}));
    EXPECT_EQ(debug->linker_options, (std::vector<std::string>{"-lc"}));
    EXPECT_EQ(debug->library_dirs, (std::vector<std::string>{"lib"}));

    EXPECT_TRUE(project.find_target("Bare")->project_libraries.empty());
}

TEST_F(ProjectModelTest, MissingTitleWarns) {
    ProjectInfo project = build(R"(
        <Option compiler="riscv32-v2" />
        <Build><Target title="Debug"><Option output="d.elf" /></Target></Build>
        <Unit filename="main.c" />)");

    EXPECT_EQ(project.title, "untitled");
    EXPECT_TRUE(diag.contains("Project has no title"));
}

TEST_F(ProjectModelTest, ProjectWithoutUnitsIsRejected) {
    EXPECT_THROW(build(R"(
        <Option compiler="riscv32-v2" />
        <Build><Target title="Debug"><Option output="d.elf" /></Target></Build>)"),
                 SemanticModelError);
}
