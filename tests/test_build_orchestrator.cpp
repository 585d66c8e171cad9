// test_build_orchestrator.cpp - End-to-end tests for BuildOrchestrator
// Part of spectre_make - Spectre Build Orchestrator

#include "core/build_orchestrator.hpp"

#include "test_harness.hpp"

#include <algorithm>
#include <vector>

using namespace spectre::make;

namespace {

// Library, one application entry point, one test
void write_small_project(const TempProject& project) {
    project.write("include/cache.h", "int cache_get(int key);\n");
    project.write("src/cache.c", "int cache_get(int key) { return key; }\n");
    project.write("src/ring.c", "int ring_size;\n");
    project.write("src/apps/main.c", "int main(void) { return 0; }\n");
    project.write("tests/test_cache.c", "int main(void) { return 0; }\n");
}

BuildResult run(const TempProject& project, BuildAction action, Profile profile = Profile::DEBUG,
                bool clean_first = false) {
    ProjectConfig cfg = project.config();
    BuildOrchestrator orchestrator(cfg, cfg.profiles.get(profile));
    return orchestrator.execute(action, clean_first);
}

bool has_error(const BuildResult& result, ErrorKind kind) {
    return std::any_of(result.errors.begin(), result.errors.end(),
                       [kind](const BuildError& e) { return e.kind == kind; });
}

} // namespace

// =============================================================================
// Action Tests
// =============================================================================

void test_action_names() {
    ASSERT(parse_action("run-tests") == BuildAction::RUN_TESTS);
    ASSERT(parse_action("executable") == BuildAction::EXECUTABLE);
    ASSERT(!parse_action("build"));
    ASSERT_EQ(std::string(action_name(BuildAction::ALL)), "all");
}

void test_build_all() {
    TempProject project("orchestrator");
    write_small_project(project);

    BuildResult result = run(project, BuildAction::ALL);
    ASSERT(result.success);
    ASSERT(result.errors.empty());
    ASSERT(result.state == ProfileState::TESTS_BUILT);
    ASSERT(!result.tests.has_value());

    ASSERT(fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(fs::exists(project.root / "bin/spectre_debug"));
    ASSERT(fs::is_symlink(project.root / "bin/spectre"));
    ASSERT(fs::exists(project.root / "bin/test_cache_debug"));
    ASSERT(fs::exists(project.root / "build/debug/obj/main.o"));
    ASSERT(fs::exists(project.root / "build/debug/test_obj/test_cache.o"));

    ASSERT_EQ(result.stats.compiled_units, 4u);
    ASSERT_EQ(result.stats.tests_linked, 1u);
    ASSERT(result.library.has_value());
    ASSERT_EQ(result.library->member_count, 2u);   // apps/main.c is not archived
    ASSERT(result.executable.has_value());
    ASSERT_EQ(result.test_executables.size(), 1u);
}

void test_library_action() {
    TempProject project("orchestrator");
    write_small_project(project);

    BuildResult result = run(project, BuildAction::LIBRARY);
    ASSERT(result.success);
    ASSERT(result.state == ProfileState::LIBRARY_READY);
    ASSERT(fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(!fs::exists(project.root / "bin/spectre_debug"));

    // Executable-only sources are not compiled for the library
    ASSERT(!fs::exists(project.root / "build/debug/obj/main.o"));
    ASSERT_EQ(result.stats.compiled_units, 2u);
}

void test_executable_action() {
    TempProject project("orchestrator");
    write_small_project(project);

    BuildResult result = run(project, BuildAction::EXECUTABLE);
    ASSERT(result.success);
    ASSERT(result.state == ProfileState::EXECUTABLE_READY);
    ASSERT(fs::exists(project.root / "bin/spectre_debug"));
    ASSERT(!fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(!fs::exists(project.root / "bin/test_cache_debug"));
}

// =============================================================================
// Incremental Tests
// =============================================================================

void test_rebuild_is_noop() {
    TempProject project("orchestrator");
    write_small_project(project);

    ASSERT(run(project, BuildAction::ALL).success);
    size_t compiles = project.compile_invocations();

    BuildResult again = run(project, BuildAction::ALL);
    ASSERT(again.success);
    ASSERT_EQ(again.stats.compiled_units, 0u);
    ASSERT_EQ(again.stats.up_to_date_units, 4u);
    ASSERT_EQ(project.compile_invocations(), compiles);
}

void test_touched_source_only() {
    TempProject project("orchestrator");
    write_small_project(project);

    ASSERT(run(project, BuildAction::ALL).success);
    fs::file_time_type ring_time = fs::last_write_time(project.root / "build/debug/obj/ring.o");

    project.touch("src/cache.c");

    BuildResult result = run(project, BuildAction::ALL);
    ASSERT(result.success);
    ASSERT_EQ(result.stats.compiled_units, 1u);
    ASSERT(fs::last_write_time(project.root / "build/debug/obj/ring.o") == ring_time);
}

void test_profile_isolation() {
    TempProject project("orchestrator");
    write_small_project(project);

    ASSERT(run(project, BuildAction::ALL, Profile::DEBUG).success);
    fs::file_time_type debug_time = fs::last_write_time(project.root / "build/debug/obj/cache.o");

    BuildResult release = run(project, BuildAction::ALL, Profile::RELEASE);
    ASSERT(release.success);
    ASSERT_EQ(release.stats.compiled_units, 4u);

    ASSERT(fs::exists(project.root / "build/release/obj/cache.o"));
    ASSERT(fs::exists(project.root / "lib/libspectre_release.a"));
    ASSERT(fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(fs::exists(project.root / "bin/test_cache_release"));
    ASSERT(fs::last_write_time(project.root / "build/debug/obj/cache.o") == debug_time);

    // Debug is still up to date
    BuildResult debug = run(project, BuildAction::ALL, Profile::DEBUG);
    ASSERT_EQ(debug.stats.compiled_units, 0u);
}

// =============================================================================
// Failure Tests
// =============================================================================

void test_compile_failure_stops_build() {
    TempProject project("orchestrator");
    project.write("src/a.c", "int a;\n");
    project.write("src/b.c", "FAIL_COMPILE\n");
    project.write("src/c.c", "int c;\n");
    project.write("tests/test_a.c", "int main(void) { return 0; }\n");

    BuildResult result = run(project, BuildAction::ALL);
    ASSERT(!result.success);
    ASSERT(result.build_failed());
    ASSERT(has_error(result, ErrorKind::COMPILE_FAILURE));
    ASSERT(result.state == ProfileState::SOURCES_DISCOVERED);

    // Sources after the failing one are never compiled
    ASSERT(fs::exists(project.root / "build/debug/obj/a.o"));
    ASSERT(!fs::exists(project.root / "build/debug/obj/c.o"));
    ASSERT(!fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(!fs::exists(project.root / "bin/spectre_debug"));
    ASSERT(!fs::exists(project.root / "bin/test_a_debug"));
    ASSERT_EQ(project.archiver_invocations(), 0u);
}

void test_object_collision() {
    TempProject project("orchestrator");
    project.write("src/net/util.c", "int a;\n");
    project.write("src/fs/util.c", "int b;\n");

    BuildResult result = run(project, BuildAction::LIBRARY);
    ASSERT(!result.success);
    ASSERT(has_error(result, ErrorKind::OBJECT_NAME_COLLISION));
    ASSERT_EQ(project.compile_invocations(), 0u);
}

void test_test_link_failure_isolated() {
    TempProject project("orchestrator");
    project.write("src/cache.c", "int cache;\n");
    project.write("tests/test_a.c", "int main(void) { return 0; }\n");
    project.write("tests/test_b.c", "FAIL_LINK\n");
    project.write("tests/test_c.c", "int main(void) { return 0; }\n");

    BuildResult result = run(project, BuildAction::TESTS);
    ASSERT(result.success);
    ASSERT(!result.build_failed());
    ASSERT(result.state == ProfileState::TESTS_BUILT);
    ASSERT(has_error(result, ErrorKind::TEST_LINK_FAILURE));
    ASSERT_EQ(result.stats.tests_linked, 2u);
    ASSERT_EQ(result.stats.test_link_failures, 1u);

    ASSERT(fs::exists(project.root / "bin/test_a_debug"));
    ASSERT(!fs::exists(project.root / "bin/test_b_debug"));
    ASSERT(fs::exists(project.root / "bin/test_c_debug"));

    // The linked tests still run and pass
    BuildResult ran = run(project, BuildAction::RUN_TESTS);
    ASSERT(ran.success);
    ASSERT(ran.tests.has_value());
    ASSERT_EQ(ran.tests->results.size(), 2u);
    ASSERT(ran.tests->all_passed);
    for (const auto& test : ran.tests->results) {
        ASSERT(test.name != "test_b_debug");
    }
}

void test_test_compile_failure_fatal() {
    TempProject project("orchestrator");
    project.write("src/cache.c", "int cache;\n");
    project.write("tests/test_a.c", "FAIL_COMPILE\n");

    BuildResult result = run(project, BuildAction::TESTS);
    ASSERT(!result.success);
    ASSERT(has_error(result, ErrorKind::COMPILE_FAILURE));
}

void test_missing_sources_fail_archive() {
    TempProject project("orchestrator");

    std::vector<BuildProgress> events;
    ProjectConfig cfg = project.config();
    BuildOrchestrator orchestrator(cfg, cfg.profiles.get(Profile::DEBUG));
    orchestrator.set_progress_callback([&events](const BuildProgress& p) { events.push_back(p); });

    BuildResult result = orchestrator.build_library();
    ASSERT(!result.success);
    ASSERT(has_error(result, ErrorKind::ARCHIVE_FAILURE));
    ASSERT(std::any_of(events.begin(), events.end(), [](const BuildProgress& p) {
        return p.level == ProgressLevel::WARNING && p.phase == BuildPhase::DISCOVERING;
    }));
}

// =============================================================================
// Test Stage Tests
// =============================================================================

void test_lazy_library() {
    TempProject project("orchestrator");
    write_small_project(project);

    BuildResult result = run(project, BuildAction::TESTS);
    ASSERT(result.success);
    ASSERT(fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(fs::exists(project.root / "bin/test_cache_debug"));
    ASSERT_EQ(project.archiver_invocations(), 1u);

    // Present library is reused
    BuildResult again = run(project, BuildAction::TESTS);
    ASSERT(again.success);
    ASSERT_EQ(project.archiver_invocations(), 1u);
}

void test_run_tests_aggregate() {
    TempProject project("orchestrator");
    project.write("src/cache.c", "int cache;\n");
    project.write("tests/test_a.c", "int main(void) { return 0; }\n");
    project.write("tests/test_b.c", "int main(void) { return 0; }\n");
    project.write("tests/test_c.c", "/* EXIT_CODE=1 */\n");

    ASSERT(run(project, BuildAction::TESTS).success);

    BuildResult result = run(project, BuildAction::RUN_TESTS);
    ASSERT(!result.success);
    ASSERT(!result.build_failed());
    ASSERT(result.tests_failed());
    ASSERT(result.state == ProfileState::TESTS_RUN);
    ASSERT_EQ(result.stats.tests_run, 3u);
    ASSERT_EQ(result.stats.tests_failed, 1u);

    ASSERT(result.tests.has_value());
    std::vector<std::string> failed = result.tests->failed_names();
    ASSERT_EQ(failed.size(), 1u);
    ASSERT_EQ(failed[0], "test_c_debug");
    ASSERT(has_error(result, ErrorKind::TEST_FAILURE));
}

void test_run_tests_empty() {
    TempProject project("orchestrator");

    BuildResult result = run(project, BuildAction::RUN_TESTS);
    ASSERT(result.success);
    ASSERT(result.tests.has_value());
    ASSERT(result.tests->results.empty());
}

// =============================================================================
// Alias and Clean Tests
// =============================================================================

void test_alias_last_build_wins() {
    TempProject project("orchestrator");
    write_small_project(project);

    ASSERT(run(project, BuildAction::EXECUTABLE, Profile::RELEASE).success);
    ASSERT(fs::read_symlink(project.root / "bin/spectre") == fs::path("spectre_release"));

    ASSERT(run(project, BuildAction::EXECUTABLE, Profile::DEBUG).success);
    ASSERT(fs::read_symlink(project.root / "bin/spectre") == fs::path("spectre_debug"));
    ASSERT(fs::exists(project.root / "bin/spectre_release"));
}

void test_clean_action() {
    TempProject project("orchestrator");
    write_small_project(project);
    ASSERT(run(project, BuildAction::ALL).success);

    BuildResult result = run(project, BuildAction::CLEAN);
    ASSERT(result.success);
    ASSERT(result.state == ProfileState::UNBUILT);
    ASSERT(!fs::exists(project.root / "build"));
    ASSERT(!fs::exists(project.root / "bin"));
    ASSERT(!fs::exists(project.root / "lib"));
    ASSERT(fs::exists(project.root / "src/cache.c"));
}

void test_clean_first() {
    TempProject project("orchestrator");
    write_small_project(project);
    ASSERT(run(project, BuildAction::ALL).success);
    size_t compiles = project.compile_invocations();

    BuildResult result = run(project, BuildAction::LIBRARY, Profile::DEBUG, true);
    ASSERT(result.success);
    ASSERT_EQ(result.stats.compiled_units, 2u);
    ASSERT_EQ(project.compile_invocations(), compiles + 2);
    ASSERT(fs::exists(project.root / "lib/libspectre_debug.a"));
    ASSERT(!fs::exists(project.root / "bin/spectre_debug"));
}

// =============================================================================
// Progress Tests
// =============================================================================

void test_progress_events() {
    TempProject project("orchestrator");
    write_small_project(project);

    ProjectConfig cfg = project.config();
    cfg.verbose = true;
    BuildOrchestrator orchestrator(cfg, cfg.profiles.get(Profile::DEBUG));

    std::vector<BuildProgress> events;
    orchestrator.set_progress_callback([&events](const BuildProgress& p) { events.push_back(p); });

    ASSERT(orchestrator.build_all().success);

    size_t compiling = 0;
    size_t commands = 0;
    for (const auto& event : events) {
        if (event.phase == BuildPhase::COMPILING && event.level == ProgressLevel::INFO) {
            compiling++;
            ASSERT(event.total > 0);
            ASSERT(event.current >= 1 && event.current <= event.total);
        }
        if (event.level == ProgressLevel::COMMAND) {
            commands++;
        }
    }
    ASSERT_EQ(compiling, 4u);
    // 4 compiles, 1 archive, 1 link, 1 test link
    ASSERT_EQ(commands, 7u);
    ASSERT(events.back().phase == BuildPhase::COMPLETE);
}

void test_quiet_commands_without_verbose() {
    TempProject project("orchestrator");
    write_small_project(project);

    ProjectConfig cfg = project.config();
    BuildOrchestrator orchestrator(cfg, cfg.profiles.get(Profile::DEBUG));

    size_t commands = 0;
    orchestrator.set_progress_callback([&commands](const BuildProgress& p) {
        if (p.level == ProgressLevel::COMMAND) commands++;
    });

    ASSERT(orchestrator.build_library().success);
    ASSERT_EQ(commands, 0u);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Build Orchestrator Test Suite ===\n\n";

    std::cout << "Action Tests:\n";
    TEST(action_names);
    TEST(build_all);
    TEST(library_action);
    TEST(executable_action);

    std::cout << "\nIncremental Tests:\n";
    TEST(rebuild_is_noop);
    TEST(touched_source_only);
    TEST(profile_isolation);

    std::cout << "\nFailure Tests:\n";
    TEST(compile_failure_stops_build);
    TEST(object_collision);
    TEST(test_link_failure_isolated);
    TEST(test_compile_failure_fatal);
    TEST(missing_sources_fail_archive);

    std::cout << "\nTest Stage Tests:\n";
    TEST(lazy_library);
    TEST(run_tests_aggregate);
    TEST(run_tests_empty);

    std::cout << "\nAlias and Clean Tests:\n";
    TEST(alias_last_build_wins);
    TEST(clean_action);
    TEST(clean_first);

    std::cout << "\nProgress Tests:\n";
    TEST(progress_events);
    TEST(quiet_commands_without_verbose);

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
