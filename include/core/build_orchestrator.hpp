/**
 * build_orchestrator.hpp
 * Central Build Orchestrator for spectre_make
 *
 * Integrates:
 * - Source Discovery for the source and test roots
 * - IncrementalCompiler for timestamp-based recompilation
 * - Archiver and Linker for the library, executable and test binaries
 * - TestRunner for execution and aggregation of test binaries
 * - WorkspaceManager for directory setup and clean
 *
 * Build Flow (per profile, strictly sequential):
 * 1. Create build/, bin/, lib/                       UNBUILT
 * 2. Discover sources, reject object-name collisions SOURCES_DISCOVERED
 * 3. Compile stale sources, abort on first failure   OBJECTS_READY
 * 4. Delete and recreate the static library          LIBRARY_READY
 * 5. Link the main executable, publish the alias     EXECUTABLE_READY
 * 6. Compile and link each test (link errors kept)   TESTS_BUILT
 * 7. Run test binaries found in bin/                 TESTS_RUN
 *
 * Fatal errors in steps 2-5 stop progression. Step 6 tolerates individual
 * link failures; step 7 always completes and only reports an aggregate.
 */

#ifndef SPECTRE_MAKE_BUILD_ORCHESTRATOR_HPP
#define SPECTRE_MAKE_BUILD_ORCHESTRATOR_HPP

#include "core/archiver.hpp"
#include "core/artifact.hpp"
#include "core/build_error.hpp"
#include "core/build_profile.hpp"
#include "core/incremental_compiler.hpp"
#include "core/linker.hpp"
#include "core/project_config.hpp"
#include "core/test_runner.hpp"
#include "core/toolchain.hpp"
#include "core/workspace.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spectre::make {

// =============================================================================
// Actions
// =============================================================================
enum class BuildAction {
    ALL,            // library, executable, tests (not run)
    LIBRARY,
    EXECUTABLE,
    TESTS,
    RUN_TESTS,
    CLEAN
};

const char* action_name(BuildAction action);
std::optional<BuildAction> parse_action(const std::string& name);

// =============================================================================
// Profile State Machine
// =============================================================================
enum class ProfileState {
    UNBUILT,
    SOURCES_DISCOVERED,
    OBJECTS_READY,
    LIBRARY_READY,
    EXECUTABLE_READY,
    TESTS_BUILT,
    TESTS_RUN
};

const char* profile_state_to_string(ProfileState state);

// =============================================================================
// Build Result
// =============================================================================
struct BuildResult {
    bool success = false;
    ProfileState state = ProfileState::UNBUILT;
    BuildStats stats;

    std::chrono::milliseconds total_time{0};

    // Fatal errors and recovered ones (test link / test failures) alike
    std::vector<BuildError> errors;

    // Artifacts produced or confirmed by this invocation
    std::optional<LibraryArtifact> library;
    std::optional<ExecutableArtifact> executable;
    std::vector<ExecutableArtifact> test_executables;

    // Present only for run-tests
    std::optional<TestRunReport> tests;

    bool has_fatal_error() const;

    // "Build failed" vs "Tests failed" for the final summary
    bool build_failed() const { return has_fatal_error(); }
    bool tests_failed() const { return tests && !tests->all_passed; }
};

// =============================================================================
// Progress Callback
// =============================================================================
enum class BuildPhase {
    CLEANING,
    PREPARING,          // Creating directories
    DISCOVERING,
    COMPILING,
    ARCHIVING,
    LINKING,
    LINKING_TESTS,
    RUNNING_TESTS,
    COMPLETE
};

enum class ProgressLevel {
    INFO,       // One line per unit of work
    DETAIL,     // Verbose-only (up-to-date units, created directories)
    COMMAND,    // Toolchain command line, reported only in verbose mode
    WARNING,
    PASS,       // Test passed
    FAIL        // Test or unit failed
};

struct BuildProgress {
    BuildPhase phase = BuildPhase::PREPARING;
    ProgressLevel level = ProgressLevel::INFO;
    size_t current = 0;
    size_t total = 0;
    std::string unit;
    std::string message;
    std::string diagnostics;    // Captured toolchain or test output, if any
};

using ProgressCallback = std::function<void(const BuildProgress&)>;

// =============================================================================
// Build Orchestrator
// =============================================================================
class BuildOrchestrator {
public:
    /**
     * Create orchestrator for one project and one resolved profile.
     */
    BuildOrchestrator(ProjectConfig config, BuildProfile profile);

    ~BuildOrchestrator();

    // No copying (stages hold references to the config and toolchain)
    BuildOrchestrator(const BuildOrchestrator&) = delete;
    BuildOrchestrator& operator=(const BuildOrchestrator&) = delete;

    // =========================================================================
    // Build Operations
    // =========================================================================

    /**
     * Run one action. With clean_first, the workspace is cleaned beforehand
     * unless the action is itself CLEAN.
     */
    BuildResult execute(BuildAction action, bool clean_first = false);

    BuildResult build_all();
    BuildResult build_library();
    BuildResult build_executable();
    BuildResult build_tests();
    BuildResult run_tests();
    BuildResult clean();

    // =========================================================================
    // Configuration
    // =========================================================================

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    const ProjectConfig& config() const { return config_; }
    const BuildProfile& profile() const { return profile_; }

    const Toolchain& toolchain() const { return toolchain_; }

private:
    // =========================================================================
    // Pipeline Stages
    // =========================================================================

    // Each stage appends to `result` and returns false on a fatal error.
    // All stage state lives in `result` and in the artifact tree.

    bool stage_clean(BuildResult& result);
    bool stage_prepare(BuildResult& result);
    bool stage_discover(BuildResult& result, std::vector<SourceFile>& sources);
    bool stage_discover_tests(BuildResult& result, std::vector<SourceFile>& tests);
    bool stage_compile(BuildResult& result,
                       const std::vector<SourceFile>& sources,
                       std::vector<ObjectArtifact>& objects);
    bool stage_archive(BuildResult& result, const std::vector<ObjectArtifact>& objects);
    bool stage_link(BuildResult& result, const std::vector<ObjectArtifact>& objects);
    bool stage_ensure_library(BuildResult& result);
    bool stage_tests(BuildResult& result);
    bool stage_run_tests(BuildResult& result);

    // Stage sequences behind each action
    bool action_all(BuildResult& result);
    bool action_library(BuildResult& result);
    bool action_executable(BuildResult& result);
    bool action_tests(BuildResult& result);

    // Wraps a stage sequence: timing, exception conversion, success flag
    BuildResult run_action(const std::function<bool(BuildResult&)>& body);

    // =========================================================================
    // Helper Functions
    // =========================================================================

    void report(BuildPhase phase, ProgressLevel level,
                const std::string& unit, const std::string& message,
                size_t current = 0, size_t total = 0,
                const std::string& diagnostics = "");

    void report_error(BuildPhase phase, const BuildError& error);

    // Record error; returns error.fatal() == false
    bool add_error(BuildResult& result, BuildPhase phase, BuildError error);

    void advance(BuildResult& result, ProfileState state);

    // =========================================================================
    // Member Data
    // =========================================================================

    const ProjectConfig config_;
    const BuildProfile profile_;

    ProcessRunner runner_;
    Toolchain toolchain_;
    WorkspaceManager workspace_;
    IncrementalCompiler compiler_;
    Archiver archiver_;
    Linker linker_;
    TestRunner test_runner_;

    ProgressCallback progress_cb_;
    BuildPhase phase_ = BuildPhase::PREPARING;   // Phase of the last report
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_BUILD_ORCHESTRATOR_HPP
