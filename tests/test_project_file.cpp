// test_project_file.cpp - Tests for the build.smk reader
// Part of spectre_make - Spectre Build Orchestrator

#include "config/project_file.hpp"
#include "core/workspace.hpp"

#include "test_harness.hpp"

using namespace spectre::make;
using namespace spectre::make::config;

// =============================================================================
// Parsing Tests
// =============================================================================

void test_empty_file_keeps_defaults() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file("", "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT(result.found);
    ASSERT_EQ(cfg.project_name, "spectre");
    ASSERT(cfg.source_dir == fs::path("src"));
    ASSERT_EQ(cfg.test_prefixes.size(), 3u);
}

void test_full_file() {
    const std::string content = R"(
# Spectre project
[project]
name = "engine"
sources = "code"
tests = "check"
include = "inc"
extensions = [".c", ".cc"]
executable_only = ["apps", "tools"]

; toolchain
[toolchain]
compiler = "clang"
archiver = "llvm-ar"

[tests]
prefixes = ["test_", "bench_"]

[profile.release]
cflags = ["-O2", "-DNDEBUG"]
)";

    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(content, "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT(result.warnings.empty());

    ASSERT_EQ(cfg.project_name, "engine");
    ASSERT(cfg.source_dir == fs::path("code"));
    ASSERT(cfg.test_dir == fs::path("check"));
    ASSERT(cfg.include_dir == fs::path("inc"));
    ASSERT_EQ(cfg.source_extensions.size(), 2u);
    ASSERT_EQ(cfg.source_extensions[1], ".cc");
    ASSERT_EQ(cfg.executable_only_dirs.size(), 2u);
    ASSERT_EQ(cfg.toolchain.compiler, "clang");
    ASSERT_EQ(cfg.toolchain.archiver, "llvm-ar");
    ASSERT_EQ(cfg.test_prefixes.size(), 2u);
    ASSERT_EQ(cfg.test_prefixes[1], "bench_");

    const BuildProfile& release = cfg.profiles.get(Profile::RELEASE);
    ASSERT_EQ(release.compiler_flags.size(), 2u);
    ASSERT_EQ(release.compiler_flags[0], "-O2");
    // ldflags not given: defaults kept
    ASSERT_EQ(release.linker_flags.size(), 3u);
}

void test_empty_array() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nexecutable_only = []\n", "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT(cfg.executable_only_dirs.empty());
}

void test_unknown_key_warns() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nversion = \"1.0\"\n[extras]\nfoo = \"bar\"\n", "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT_EQ(result.warnings.size(), 2u);
    ASSERT(result.warnings[0].find("build.smk:2") != std::string::npos);
    ASSERT(result.warnings[0].find("version") != std::string::npos);
    ASSERT(result.warnings[1].find("extras") != std::string::npos);
}

// =============================================================================
// Error Tests
// =============================================================================

void test_unknown_profile_section() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[profile.turbo]\ncflags = [\"-O3\"]\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::UNKNOWN_PROFILE);
}

void test_missing_equals() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nname \"x\"\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
    ASSERT_EQ(result.error.unit, "build.smk:2");
}

void test_malformed_header() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file("[project\nname = \"x\"\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
    ASSERT_EQ(result.error.unit, "build.smk:1");
}

void test_type_mismatch() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nextensions = \".c\"\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);

    result = parse_project_file("[project]\nextensions = [\".c\"\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.message.find("unterminated") != std::string::npos);
}

void test_failure_leaves_config_untouched() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nname = \"changed\"\n[toolchain]\ncompiler\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT_EQ(cfg.project_name, "spectre");
}

void test_input_roots_stay_inside_project() {
    const char* rejected[] = {
        "[project]\nsources = \".\"\n",
        "[project]\nsources = \"..\"\n",
        "[project]\nsources = \"src/../..\"\n",
        "[project]\nsources = \"/usr/src\"\n",
        "[project]\ntests = \"bin/checks\"\n",
        "[project]\ninclude = \"./build\"\n",
        "[project]\nsources = \"lib\"\n",
    };
    for (const char* content : rejected) {
        ProjectConfig cfg;
        ProjectFileResult result = parse_project_file(content, "build.smk", cfg);
        ASSERT(!result.ok());
        ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
        ASSERT(cfg.source_dir == fs::path("src"));
    }

    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[project]\nsources = \"./code/\"\n", "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT(cfg.source_dir == fs::path("code/"));
}

void test_unquoted_array_item() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[profile.debug]\ncflags = [\"-O2\", -g]\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
    ASSERT_EQ(result.error.unit, "build.smk:2");

    result = parse_project_file("[project]\nextensions = [c]\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT_EQ(cfg.source_extensions.size(), 1u);
}

void test_empty_prefix_rejected() {
    ProjectConfig cfg;
    ProjectFileResult result = parse_project_file(
        "[tests]\nprefixes = [\"test_\", \"\"]\n", "build.smk", cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
    ASSERT_EQ(cfg.test_prefixes.size(), 3u);
}

// =============================================================================
// Output Layout Tests
// =============================================================================

void test_output_roots_not_configurable() {
    TempProject project("project_file");
    project.write("src/cache.c", "int cache;\n");
    project.write("tests/test_cache.c", "int t;\n");

    ProjectConfig cfg = project.config();
    ProjectFileResult result = parse_project_file(
        "[project]\nbin = \".\"\nbuild = \"src\"\nlib = \"tests\"\n", "build.smk", cfg);
    ASSERT(result.ok());
    ASSERT_EQ(result.warnings.size(), 3u);
    ASSERT(cfg.bin_root() == project.root / "bin");
    ASSERT(cfg.build_root() == project.root / "build");
    ASSERT(cfg.lib_root() == project.root / "lib");

    WorkspaceManager workspace(cfg);
    ASSERT(workspace.setup().ok());
    ASSERT(workspace.clean().ok());
    ASSERT(fs::exists(project.root / "src/cache.c"));
    ASSERT(fs::exists(project.root / "tests/test_cache.c"));
    ASSERT(fs::is_directory(project.root));
}

// =============================================================================
// Loading Tests
// =============================================================================

void test_load_missing_optional() {
    TempProject project("project_file");
    ProjectConfig cfg;
    ProjectFileResult result = load_project_file(project.root / "build.smk", false, cfg);
    ASSERT(result.ok());
    ASSERT(!result.found);
}

void test_load_missing_required() {
    TempProject project("project_file");
    ProjectConfig cfg;
    ProjectFileResult result = load_project_file(project.root / "custom.smk", true, cfg);
    ASSERT(!result.ok());
    ASSERT(result.error.kind == ErrorKind::CONFIG_ERROR);
}

void test_load_from_disk() {
    TempProject project("project_file");
    write_file(project.root / "build.smk", "[project]\nname = \"disk\"\n");

    ProjectConfig cfg;
    ProjectFileResult result = load_project_file(project.root / "build.smk", true, cfg);
    ASSERT(result.ok());
    ASSERT(result.found);
    ASSERT_EQ(cfg.project_name, "disk");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Project File Test Suite ===\n\n";

    std::cout << "Parsing Tests:\n";
    TEST(empty_file_keeps_defaults);
    TEST(full_file);
    TEST(empty_array);
    TEST(unknown_key_warns);

    std::cout << "\nError Tests:\n";
    TEST(unknown_profile_section);
    TEST(missing_equals);
    TEST(malformed_header);
    TEST(type_mismatch);
    TEST(failure_leaves_config_untouched);
    TEST(input_roots_stay_inside_project);
    TEST(unquoted_array_item);
    TEST(empty_prefix_rejected);

    std::cout << "\nOutput Layout Tests:\n";
    TEST(output_roots_not_configurable);

    std::cout << "\nLoading Tests:\n";
    TEST(load_missing_optional);
    TEST(load_missing_required);
    TEST(load_from_disk);

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
