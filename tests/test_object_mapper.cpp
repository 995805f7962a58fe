#include "test_support.hpp"
#include "resolvers/object_mapper.hpp"

using namespace cbp;
using namespace cbp::test;

class ObjectMapperTest : public ::testing::Test {
protected:
    ObjectMapperTest() {
        target.name = "Debug";
        target.compiler_id = "riscv32-v2";
        target.output = "build/app.elf";
        target.object_output = "obj/Debug";
    }

    SourceFile unit(const std::string& path) {
        SourceFile source;
        source.path = path;
        return source;
    }

    // Entries point into the units, which live as long as the fixture
    std::vector<ClassifiedSource> map(const std::vector<SourceFile>& sources) {
        units = sources;
        ObjectMapper mapper(diag);
        return mapper.map_target(target, units);
    }

    Diagnostics diag;
    Target target;
    std::vector<SourceFile> units;
};

TEST_F(ObjectMapperTest, MapsRelativeSources) {
    EXPECT_EQ(map_object_path("obj/Debug", "src/main.c"), "obj/Debug/src/main.o");
    EXPECT_EQ(map_object_path("obj/Debug", "./src/../main.cpp"), "obj/Debug/main.o");
    EXPECT_EQ(map_object_path("obj/Debug", "startup.S"), "obj/Debug/startup.o");
}

TEST_F(ObjectMapperTest, ParentSegmentsStayInsideObjectRoot) {
    EXPECT_EQ(map_object_path("obj", "../common/util.c"), "obj/_up/common/util.o");
    EXPECT_EQ(map_object_path("obj", "../../x.s"), "obj/_up/_up/x.o");
}

TEST_F(ObjectMapperTest, AbsoluteSourcesGetOwnSubtree) {
    EXPECT_EQ(map_object_path("obj", "/opt/sdk/a.c"), "obj/_abs/opt/sdk/a.o");
    EXPECT_EQ(map_object_path("obj", "C:\\sdk\\a.c"), "obj/_abs/_C/sdk/a.o");
}

TEST_F(ObjectMapperTest, UnderscoreSegmentsAreEscaped) {
    EXPECT_EQ(map_object_path("obj", "_gen/table.c"), "obj/__gen/table.o");
    EXPECT_EQ(map_object_path("obj", "src/_start.S"), "obj/src/__start.o");
}

TEST_F(ObjectMapperTest, ClassifiesByExtension) {
    EXPECT_EQ(classify_extension("a.c"), SourceKind::C);
    EXPECT_EQ(classify_extension("a.cpp"), SourceKind::Cxx);
    EXPECT_EQ(classify_extension("a.CPP"), SourceKind::Cxx);
    EXPECT_EQ(classify_extension("a.C"), SourceKind::Cxx);
    EXPECT_EQ(classify_extension("a.cc"), SourceKind::Cxx);
    EXPECT_EQ(classify_extension("a.S"), SourceKind::PreprocessedAssembly);
    EXPECT_EQ(classify_extension("a.s"), SourceKind::Assembly);
    EXPECT_EQ(classify_extension("a.h"), SourceKind::Ignored);
    EXPECT_EQ(classify_extension("Makefile"), SourceKind::Ignored);

    EXPECT_TRUE(is_normal_source(SourceKind::Cxx));
    EXPECT_FALSE(is_normal_source(SourceKind::Assembly));
    EXPECT_TRUE(is_assembly_source(SourceKind::PreprocessedAssembly));
}

TEST_F(ObjectMapperTest, DistinctSourcesGetDistinctObjects) {
    std::vector<SourceFile> sources = {unit("a.c"), unit("b/a.c"), unit("../a.c"),
                                       unit("/a.c"), unit("../../b/a.c"), unit("a.s.c"),
                                       unit("__/a.c"), unit("_abs/a.c")};
    std::vector<ClassifiedSource> mapped = map(sources);

    std::set<std::string> objects;
    for (const auto& entry : mapped) {
        EXPECT_EQ(entry.object.rfind("obj/Debug/", 0), 0u) << entry.object;
        objects.insert(entry.object);
    }
    EXPECT_EQ(objects.size(), sources.size());
}

TEST_F(ObjectMapperTest, SameStemDifferentExtensionCollides) {
    try {
        map({unit("src/a.c"), unit("src/a.cpp")});
        FAIL() << "expected PathMappingError";
    } catch (const PathMappingError& e) {
        EXPECT_EQ(e.stage(), "objects");
        EXPECT_TRUE(contains_text(e.what(), "src/a.c"));
        EXPECT_TRUE(contains_text(e.what(), "src/a.cpp"));
        EXPECT_TRUE(contains_text(e.what(), "obj/Debug/src/a.o"));
    }
}

TEST_F(ObjectMapperTest, ParentSegmentsNeverMeetRealDirectories) {
    EXPECT_NE(map_object_path("obj/Debug", "../a.c"), map_object_path("obj/Debug", "__/a.c"));
    EXPECT_NE(map_object_path("obj/Debug", "../a.c"), map_object_path("obj/Debug", "_up/a.c"));
    EXPECT_NE(map_object_path("obj/Debug", "/sdk/a.c"), map_object_path("obj/Debug", "_abs/sdk/a.c"));
    EXPECT_NE(map_object_path("obj/Debug", "C:/sdk/a.c"), map_object_path("obj/Debug", "/C_/sdk/a.c"));

    std::vector<ClassifiedSource> mapped = map({unit("../a.c"), unit("__/a.c"), unit("_up/a.c")});
    ASSERT_EQ(mapped.size(), 3u);
    EXPECT_EQ(mapped[0].object, "obj/Debug/_up/a.o");
    EXPECT_EQ(mapped[1].object, "obj/Debug/___/a.o");
    EXPECT_EQ(mapped[2].object, "obj/Debug/__up/a.o");
}

TEST_F(ObjectMapperTest, UnitsOfOtherTargetsAreSkipped) {
    SourceFile release_only = unit("release.c");
    release_only.targets = {"Release"};
    std::vector<ClassifiedSource> mapped = map({unit("main.c"), release_only});

    ASSERT_EQ(mapped.size(), 1u);
    EXPECT_EQ(mapped[0].source->path, "main.c");
}

TEST_F(ObjectMapperTest, UncompiledAndHeaderUnitsAreIgnored) {
    SourceFile blob = unit("blob.c");
    blob.compile = false;
    std::vector<ClassifiedSource> mapped = map({blob, unit("board.h")});

    ASSERT_EQ(mapped.size(), 2u);
    EXPECT_EQ(mapped[0].kind, SourceKind::Ignored);
    EXPECT_TRUE(mapped[0].object.empty());
    EXPECT_EQ(mapped[1].kind, SourceKind::Ignored);
    EXPECT_FALSE(diag.has_warnings());
}

TEST_F(ObjectMapperTest, UnknownExtensionWarns) {
    std::vector<ClassifiedSource> mapped = map({unit("tables.py")});
    EXPECT_EQ(mapped[0].kind, SourceKind::Ignored);
    EXPECT_TRUE(diag.contains("has no build rule for '.py'"));
}

TEST_F(ObjectMapperTest, CustomBuildMatchesCompiler) {
    SourceFile gen = unit("gen.c");
    gen.custom_builds = {{"riscv32-v1", "old"}, {"riscv32-v2", "new"}};
    EXPECT_EQ(select_custom_build(gen, "riscv32-v2")->command, "new");
    EXPECT_EQ(select_custom_build(gen, "riscv32-v3")->command, "old");
    EXPECT_EQ(select_custom_build(unit("plain.c"), "riscv32-v2"), nullptr);

    std::vector<ClassifiedSource> mapped = map({gen});
    EXPECT_EQ(mapped[0].kind, SourceKind::Special);
    ASSERT_NE(mapped[0].custom_build, nullptr);
    EXPECT_EQ(mapped[0].custom_build->command, "new");
    EXPECT_EQ(mapped[0].object, "obj/Debug/gen.o");
}
