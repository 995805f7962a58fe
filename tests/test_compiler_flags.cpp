#include "test_support.hpp"
#include "resolvers/compiler_flags.hpp"

using namespace cbp;
using namespace cbp::test;

class CompilerFlagsTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_root_ = ToolchainRegistry::instance().root();
    }

    void TearDown() override {
        ToolchainRegistry::instance().set_root(saved_root_);
    }

    Target make_target(const std::string& compiler, const std::vector<std::string>& flags) {
        Target target;
        target.name = "Debug";
        target.compiler_id = compiler;
        target.output = "out.elf";
        target.compiler_options = flags;
        return target;
    }

    Diagnostics diag;

private:
    std::string saved_root_;
};

using Split = std::pair<std::string, std::string>;

TEST_F(CompilerFlagsTest, SplitMarchKeepsStandardIsa) {
    EXPECT_EQ(split_march("rv32imac"), (Split{"rv32imac", ""}));
    EXPECT_EQ(split_march("rv32gc"), (Split{"rv32gc", ""}));
    EXPECT_EQ(split_march("rv32imac_zicsr_zifencei"), (Split{"rv32imac_zicsr_zifencei", ""}));
    EXPECT_EQ(split_march("rv32i2p0_m2p0_c"), (Split{"rv32i2p0_m2p0_c", ""}));
}

TEST_F(CompilerFlagsTest, SplitMarchSeparatesVendorExtension) {
    EXPECT_EQ(split_march("rv32imac_xsample"), (Split{"rv32imac", "_xsample"}));
    EXPECT_EQ(split_march("rv32imac_zicsr_xw"), (Split{"rv32imac_zicsr", "_xw"}));
    EXPECT_EQ(split_march("rv32gcxv"), (Split{"rv32gc", "xv"}));
}

TEST_F(CompilerFlagsTest, SplitMarchLeavesForeignValuesWhole) {
    EXPECT_EQ(split_march("native"), (Split{"native", ""}));
    EXPECT_EQ(split_march("armv7-a"), (Split{"armv7-a", ""}));
    EXPECT_EQ(split_march(""), (Split{"", ""}));
}

TEST_F(CompilerFlagsTest, SplitMarchPartsRecombine) {
    for (const char* value : {"rv32imac_xsample", "rv32gcxv", "rv32imac_zicsr_xw_xq", "rv64gc", "native"}) {
        Split parts = split_march(value);
        EXPECT_EQ(parts.first + parts.second, value);
        EXPECT_EQ(split_march(parts.first).first, parts.first) << value;
    }
}

TEST_F(CompilerFlagsTest, LastMarchWins) {
    MarchInfo info = detect_march({"-Wall", "-march=rv32imac", "-O2 -march=rv32imac_xfast"});
    ASSERT_TRUE(info.present());
    EXPECT_EQ(info.full_flag, "-march=rv32imac_xfast");
    EXPECT_EQ(info.base, "rv32imac");
    EXPECT_EQ(info.extension, "_xfast");
    EXPECT_TRUE(info.has_custom_extension());
    EXPECT_EQ(info.base_flag(), "-march=rv32imac");
}

TEST_F(CompilerFlagsTest, NoMarchDetected) {
    MarchInfo info = detect_march({"-Wall", "-mabi=ilp32"});
    EXPECT_FALSE(info.present());
    EXPECT_FALSE(info.has_custom_extension());
}

TEST_F(CompilerFlagsTest, FlagKeys) {
    EXPECT_EQ(flag_key("-O2"), flag_key("-Os"));
    EXPECT_EQ(flag_key("-DDEBUG=1"), "macro:DEBUG");
    EXPECT_EQ(flag_key("-UDEBUG"), "macro:DEBUG");
    EXPECT_EQ(flag_key("-fno-rtti"), flag_key("-frtti"));
    EXPECT_EQ(flag_key("-g"), flag_key("-g3"));
    EXPECT_EQ(flag_key("-std=c99"), "-std");
    EXPECT_NE(flag_key("-Iinclude"), flag_key("-Isrc"));
    EXPECT_NE(flag_key("-Wall"), flag_key("-Wextra"));
}

TEST_F(CompilerFlagsTest, OverridesReplaceMatchingFlags) {
    std::vector<std::string> base = {"-O2", "-DLEVEL=1", "-Wall", "-g"};
    std::vector<std::string> result = apply_flag_overrides(base, {"-O0", "-ULEVEL"});
    EXPECT_EQ(result, (std::vector<std::string>{"-Wall", "-g", "-O0", "-ULEVEL"}));
}

TEST_F(CompilerFlagsTest, OverridesDoNotDuplicate) {
    std::vector<std::string> result = apply_flag_overrides({"-Wall", "-O2"}, {"-Wall"});
    EXPECT_EQ(result, (std::vector<std::string>{"-O2", "-Wall"}));
}

TEST_F(CompilerFlagsTest, DedupeKeepsFirstOccurrence) {
    EXPECT_EQ(dedupe_preserving_order({"-a", "-b", "-a", "-c", "-b"}),
              (std::vector<std::string>{"-a", "-b", "-c"}));
}

TEST_F(CompilerFlagsTest, AnalyzeKnownCompiler) {
    ToolchainRegistry::instance().set_root("/toolchains");
    CompilerFlagAnalyzer analyzer(diag);

    Target target = make_target("riscv32-v2", {"-march=rv32imac_xsample", "-Wall", "-Wall"});
    target.include_dirs = {"include", "include", "src"};
    ResolvedOptions options = analyzer.analyze(target);

    EXPECT_TRUE(options.profile.is_known());
    EXPECT_EQ(options.profile.rule_suffix(), "riscv32_v2");
    EXPECT_EQ(to_unix_path(options.profile.install_dir), "/toolchains/RV32-V2");
    EXPECT_EQ(options.compiler_flags, (std::vector<std::string>{"-march=rv32imac_xsample", "-Wall"}));
    EXPECT_EQ(options.include_flags(), (std::vector<std::string>{"-Iinclude", "-Isrc"}));
    EXPECT_EQ(options.march.extension, "_xsample");
    EXPECT_TRUE(contains(options.profile.default_flags, "--target=riscv32-unknown-elf"));
    EXPECT_FALSE(diag.contains("Unknown compiler"));
}

TEST_F(CompilerFlagsTest, UnknownCompilerWarnsAndContinues) {
    CompilerFlagAnalyzer analyzer(diag);
    ResolvedOptions options = analyzer.analyze(make_target("armcc", {"-O1"}));

    EXPECT_FALSE(options.profile.is_known());
    EXPECT_EQ(options.profile.rule_suffix(), "generic");
    EXPECT_FALSE(options.profile.default_flags.empty());
    EXPECT_TRUE(options.profile.include_paths().empty());
    EXPECT_TRUE(diag.contains("Unknown compiler 'armcc'"));

    ToolSet tools = ToolchainRegistry::instance().resolve_tools(options.profile, diag);
    EXPECT_EQ(tools.cc, "gcc");
    EXPECT_EQ(tools.ar, "ar");
}

TEST_F(CompilerFlagsTest, CompilerIdsAreCaseInsensitive) {
    EXPECT_EQ(ToolchainRegistry::instance().family_of("RISCV32-V3"), CompilerFamily::RiscV32V3);
    EXPECT_FALSE(ToolchainRegistry::instance().family_of("riscv32-v9").has_value());

    ToolchainProfile profile = ToolchainRegistry::instance().resolve("RiscV32-V3", diag);
    EXPECT_EQ(profile.id, "riscv32-v3");
    EXPECT_EQ(profile.rule_suffix(), "riscv32_v3");
}

TEST_F(CompilerFlagsTest, EachFamilyCarriesItsRelease) {
    ToolchainRegistry::instance().set_root("/toolchains");
    ToolchainProfile v1 = ToolchainRegistry::instance().resolve("riscv32-v1", diag);
    ToolchainProfile v3 = ToolchainRegistry::instance().resolve("riscv32-v3", diag);

    EXPECT_EQ(v1.family, CompilerFamily::RiscV32V1);
    EXPECT_EQ(v1.gcc_version, "6.1.0");
    EXPECT_EQ(to_unix_path(v1.install_dir), "/toolchains/RV32-V1");
    EXPECT_EQ(v3.family, CompilerFamily::RiscV32V3);
    EXPECT_EQ(v3.gcc_version, "14.2.0");
    EXPECT_EQ(to_unix_path(v3.include_paths()[0]), "/toolchains/RV32-V3/lib/gcc/riscv32-elf/14.2.0/include");
}

TEST_F(CompilerFlagsTest, MissingToolsFallBackToPath) {
    ToolchainRegistry::instance().set_root("/nonexistent/toolchains");
    ToolchainProfile profile = ToolchainRegistry::instance().resolve("riscv32-v1", diag);
    ToolSet tools = ToolchainRegistry::instance().resolve_tools(profile, diag);

    EXPECT_EQ(tools.cc, "riscv32-elf-gcc");
    EXPECT_EQ(tools.cxx, "riscv32-elf-g++");
    EXPECT_EQ(tools.ld, "riscv32-elf-ld");
    EXPECT_TRUE(diag.contains("Toolchain tools not found"));
}

TEST_F(CompilerFlagsTest, PerFileFlagsAndIncludes) {
    CompilerFlagAnalyzer analyzer(diag);
    Target target = make_target("riscv32-v2", {"-O2", "-Wall"});
    target.include_dirs = {"include"};
    ResolvedOptions options = analyzer.analyze(target);

    SourceFile plain;
    plain.path = "main.c";
    EXPECT_EQ(analyzer.flags_for(options, plain), options.compiler_flags);

    SourceFile hot;
    hot.path = "hot.c";
    hot.compiler_options = {"-O3"};
    hot.include_dirs = {"hot", "include"};
    EXPECT_EQ(analyzer.flags_for(options, hot), (std::vector<std::string>{"-Wall", "-O3"}));
    EXPECT_EQ(analyzer.include_dirs_for(options, hot), (std::vector<std::string>{"hot", "include"}));
}
