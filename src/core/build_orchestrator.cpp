/**
 * build_orchestrator.cpp
 * Implementation of the Central Build Orchestrator
 */

#include "core/build_orchestrator.hpp"

#include "discovery/source_discovery.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace spectre::make {

// =============================================================================
// Actions and States
// =============================================================================

const char* action_name(BuildAction action) {
    switch (action) {
        case BuildAction::ALL:        return "all";
        case BuildAction::LIBRARY:    return "library";
        case BuildAction::EXECUTABLE: return "executable";
        case BuildAction::TESTS:      return "tests";
        case BuildAction::RUN_TESTS:  return "run-tests";
        case BuildAction::CLEAN:      return "clean";
        default:                      return "unknown";
    }
}

std::optional<BuildAction> parse_action(const std::string& name) {
    if (name == "all")        return BuildAction::ALL;
    if (name == "library")    return BuildAction::LIBRARY;
    if (name == "executable") return BuildAction::EXECUTABLE;
    if (name == "tests")      return BuildAction::TESTS;
    if (name == "run-tests")  return BuildAction::RUN_TESTS;
    if (name == "clean")      return BuildAction::CLEAN;
    return std::nullopt;
}

const char* profile_state_to_string(ProfileState state) {
    switch (state) {
        case ProfileState::UNBUILT:            return "unbuilt";
        case ProfileState::SOURCES_DISCOVERED: return "sources_discovered";
        case ProfileState::OBJECTS_READY:      return "objects_ready";
        case ProfileState::LIBRARY_READY:      return "library_ready";
        case ProfileState::EXECUTABLE_READY:   return "executable_ready";
        case ProfileState::TESTS_BUILT:        return "tests_built";
        case ProfileState::TESTS_RUN:          return "tests_run";
        default:                               return "unknown";
    }
}

bool BuildResult::has_fatal_error() const {
    return std::any_of(errors.begin(), errors.end(),
                       [](const BuildError& e) { return e.fatal(); });
}

namespace {

std::vector<SourceFile> filter_group(const std::vector<SourceFile>& sources, SourceGroup group) {
    std::vector<SourceFile> filtered;
    for (const auto& source : sources) {
        if (source.group == group) {
            filtered.push_back(source);
        }
    }
    return filtered;
}

std::string display_name(const fs::path& path) {
    return path.filename().string();
}

} // namespace

// =============================================================================
// Build Orchestrator Implementation
// =============================================================================

BuildOrchestrator::BuildOrchestrator(ProjectConfig config, BuildProfile profile)
    : config_(std::move(config))
    , profile_(std::move(profile))
    , toolchain_(config_.toolchain, runner_)
    , workspace_(config_)
    , compiler_(config_, toolchain_)
    , archiver_(config_, toolchain_)
    , linker_(config_, toolchain_)
    , test_runner_(config_, runner_)
{
    if (config_.verbose) {
        toolchain_.set_command_observer([this](const std::vector<std::string>& args) {
            report(phase_, ProgressLevel::COMMAND, "", format_command(args));
        });
    }
}

BuildOrchestrator::~BuildOrchestrator() = default;

BuildResult BuildOrchestrator::execute(BuildAction action, bool clean_first) {
    const bool pre_clean = clean_first && action != BuildAction::CLEAN;

    return run_action([this, action, pre_clean](BuildResult& result) {
        if (pre_clean && !stage_clean(result)) {
            return false;
        }

        switch (action) {
            case BuildAction::ALL:        return action_all(result);
            case BuildAction::LIBRARY:    return action_library(result);
            case BuildAction::EXECUTABLE: return action_executable(result);
            case BuildAction::TESTS:      return action_tests(result);
            case BuildAction::RUN_TESTS:  return stage_run_tests(result);
            case BuildAction::CLEAN:      return stage_clean(result);
        }
        return false;
    });
}

BuildResult BuildOrchestrator::build_all()        { return execute(BuildAction::ALL); }
BuildResult BuildOrchestrator::build_library()    { return execute(BuildAction::LIBRARY); }
BuildResult BuildOrchestrator::build_executable() { return execute(BuildAction::EXECUTABLE); }
BuildResult BuildOrchestrator::build_tests()      { return execute(BuildAction::TESTS); }
BuildResult BuildOrchestrator::run_tests()        { return execute(BuildAction::RUN_TESTS); }
BuildResult BuildOrchestrator::clean()            { return execute(BuildAction::CLEAN); }

BuildResult BuildOrchestrator::run_action(const std::function<bool(BuildResult&)>& body) {
    auto start_time = std::chrono::steady_clock::now();
    BuildResult result;

    bool completed = false;
    try {
        completed = body(result);
    } catch (const std::exception& e) {
        // Process creation and other system failures surface here
        add_error(result, phase_, BuildError(ErrorKind::SYSTEM_ERROR, "", e.what()));
        completed = false;
    }

    auto end_time = std::chrono::steady_clock::now();
    result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);

    result.success = completed && !result.has_fatal_error() && !result.tests_failed();
    report(BuildPhase::COMPLETE, ProgressLevel::INFO, "",
           result.success ? "Build complete" : "Build stopped");

    return result;
}

// =============================================================================
// Action Sequences
// =============================================================================

bool BuildOrchestrator::action_all(BuildResult& result) {
    std::vector<SourceFile> sources;
    std::vector<ObjectArtifact> objects;

    if (!stage_prepare(result)) return false;
    if (!stage_discover(result, sources)) return false;
    if (!stage_compile(result, sources, objects)) return false;
    if (!stage_archive(result, objects)) return false;
    if (!stage_link(result, objects)) return false;
    return stage_tests(result);
}

bool BuildOrchestrator::action_library(BuildResult& result) {
    std::vector<SourceFile> sources;
    std::vector<ObjectArtifact> objects;

    if (!stage_prepare(result)) return false;
    if (!stage_discover(result, sources)) return false;
    if (!stage_compile(result, filter_group(sources, SourceGroup::LIBRARY), objects)) return false;
    return stage_archive(result, objects);
}

bool BuildOrchestrator::action_executable(BuildResult& result) {
    std::vector<SourceFile> sources;
    std::vector<ObjectArtifact> objects;

    if (!stage_prepare(result)) return false;
    if (!stage_discover(result, sources)) return false;
    if (!stage_compile(result, sources, objects)) return false;
    return stage_link(result, objects);
}

bool BuildOrchestrator::action_tests(BuildResult& result) {
    if (!stage_prepare(result)) return false;
    return stage_tests(result);
}

// =============================================================================
// Build Pipeline Stages
// =============================================================================

bool BuildOrchestrator::stage_clean(BuildResult& result) {
    report(BuildPhase::CLEANING, ProgressLevel::INFO, "", "Cleaning build artifacts...");

    CleanReport cleaned = workspace_.clean();
    for (const auto& root : cleaned.removed_roots) {
        report(BuildPhase::CLEANING, ProgressLevel::DETAIL, root.string(), "Removed");
    }
    if (!cleaned.ok()) {
        return add_error(result, BuildPhase::CLEANING, cleaned.error);
    }

    if (!cleaned.removed_strays.empty()) {
        report(BuildPhase::CLEANING, ProgressLevel::INFO, "",
               "Removed " + std::to_string(cleaned.removed_strays.size()) +
               " stray object/archive file(s)");
    }

    result.state = ProfileState::UNBUILT;
    return true;
}

bool BuildOrchestrator::stage_prepare(BuildResult& result) {
    report(BuildPhase::PREPARING, ProgressLevel::DETAIL, "", "Creating output directories");

    SetupReport setup = workspace_.setup();
    for (const auto& dir : setup.created) {
        report(BuildPhase::PREPARING, ProgressLevel::DETAIL, dir.string(), "Created");
    }
    if (!setup.ok()) {
        return add_error(result, BuildPhase::PREPARING, setup.error);
    }
    return true;
}

bool BuildOrchestrator::stage_discover(BuildResult& result, std::vector<SourceFile>& sources) {
    report(BuildPhase::DISCOVERING, ProgressLevel::DETAIL, "",
           "Scanning " + config_.source_root().string());

    discovery::DiscoveryResult found = discovery::discover_project_sources(config_);
    if (!found.ok()) {
        return add_error(result, BuildPhase::DISCOVERING,
                         BuildError(ErrorKind::FILESYSTEM_ERROR, config_.source_root().string(),
                                    found.error_message));
    }
    if (!found.root_exists) {
        report(BuildPhase::DISCOVERING, ProgressLevel::WARNING, config_.source_root().string(),
               "source root not found, no sources to build");
    }

    if (auto collision = discovery::find_object_collision(found.sources)) {
        return add_error(result, BuildPhase::DISCOVERING,
                         BuildError(ErrorKind::OBJECT_NAME_COLLISION, collision->object_name,
                                    collision->first.string() + " and " +
                                    collision->second.string() + " map to the same object"));
    }

    sources = std::move(found.sources);
    advance(result, ProfileState::SOURCES_DISCOVERED);
    return true;
}

bool BuildOrchestrator::stage_discover_tests(BuildResult& result, std::vector<SourceFile>& tests) {
    report(BuildPhase::DISCOVERING, ProgressLevel::DETAIL, "",
           "Scanning " + config_.test_root().string());

    discovery::DiscoveryResult found = discovery::discover_test_sources(config_);
    if (!found.ok()) {
        return add_error(result, BuildPhase::DISCOVERING,
                         BuildError(ErrorKind::FILESYSTEM_ERROR, config_.test_root().string(),
                                    found.error_message));
    }
    if (!found.root_exists) {
        report(BuildPhase::DISCOVERING, ProgressLevel::WARNING, config_.test_root().string(),
               "test root not found, no tests to build");
    }

    if (auto collision = discovery::find_object_collision(found.sources)) {
        return add_error(result, BuildPhase::DISCOVERING,
                         BuildError(ErrorKind::OBJECT_NAME_COLLISION, collision->object_name,
                                    collision->first.string() + " and " +
                                    collision->second.string() + " map to the same object"));
    }

    tests = std::move(found.sources);
    return true;
}

bool BuildOrchestrator::stage_compile(BuildResult& result,
                                      const std::vector<SourceFile>& sources,
                                      std::vector<ObjectArtifact>& objects) {
    const size_t total = sources.size();

    for (size_t i = 0; i < total; ++i) {
        const SourceFile& source = sources[i];
        const std::string name = display_name(source.path);

        Staleness staleness = compiler_.check_staleness(source, profile_);
        if (staleness == Staleness::FRESH) {
            report(BuildPhase::COMPILING, ProgressLevel::DETAIL, name, "Up to date", i + 1, total);
        } else {
            report(BuildPhase::COMPILING, ProgressLevel::INFO, name, "Compiling " + name, i + 1, total);
        }

        CompileOutcome outcome = compiler_.compile(source, profile_);
        if (!outcome.ok()) {
            // No further sources are compiled after the first failure
            return add_error(result, BuildPhase::COMPILING, outcome.error);
        }

        if (outcome.invoked) {
            result.stats.compiled_units++;
        } else {
            result.stats.up_to_date_units++;
        }
        objects.push_back(outcome.artifact);
    }

    advance(result, ProfileState::OBJECTS_READY);
    return true;
}

bool BuildOrchestrator::stage_archive(BuildResult& result, const std::vector<ObjectArtifact>& objects) {
    fs::path library = archiver_.library_path(profile_);
    report(BuildPhase::ARCHIVING, ProgressLevel::INFO, display_name(library),
           "Archiving " + display_name(library));

    ArchiveOutcome outcome = archiver_.archive(profile_, objects);
    if (!outcome.ok()) {
        return add_error(result, BuildPhase::ARCHIVING, outcome.error);
    }

    result.library = outcome.library;
    advance(result, ProfileState::LIBRARY_READY);
    return true;
}

bool BuildOrchestrator::stage_link(BuildResult& result, const std::vector<ObjectArtifact>& objects) {
    fs::path executable = config_.executable_path(profile_);
    report(BuildPhase::LINKING, ProgressLevel::INFO, display_name(executable),
           "Linking " + display_name(executable));

    LinkOutcome outcome = linker_.link_executable(profile_, objects, profile_.linker_flags);
    if (!outcome.ok()) {
        return add_error(result, BuildPhase::LINKING, outcome.error);
    }

    result.executable = outcome.executable;
    report(BuildPhase::LINKING, ProgressLevel::DETAIL, config_.alias_path().string(),
           "-> " + display_name(executable));
    advance(result, ProfileState::EXECUTABLE_READY);
    return true;
}

bool BuildOrchestrator::stage_ensure_library(BuildResult& result) {
    fs::path library = archiver_.library_path(profile_);

    std::error_code ec;
    if (fs::is_regular_file(library, ec)) {
        // Present libraries are reused as-is, even if older than their sources
        if (!result.library) {
            LibraryArtifact existing;
            existing.path = library;
            existing.profile = profile_.id;
            result.library = existing;
        }
        return true;
    }

    report(BuildPhase::ARCHIVING, ProgressLevel::INFO, display_name(library),
           "Library missing, building it first");

    std::vector<SourceFile> sources;
    std::vector<ObjectArtifact> objects;
    if (!stage_discover(result, sources)) return false;
    if (!stage_compile(result, filter_group(sources, SourceGroup::LIBRARY), objects)) return false;
    return stage_archive(result, objects);
}

bool BuildOrchestrator::stage_tests(BuildResult& result) {
    std::vector<SourceFile> tests;
    if (!stage_discover_tests(result, tests)) return false;

    if (tests.empty()) {
        report(BuildPhase::LINKING_TESTS, ProgressLevel::WARNING, "", "No test sources found");
        advance(result, ProfileState::TESTS_BUILT);
        return true;
    }

    if (!stage_ensure_library(result)) return false;
    const LibraryArtifact library = *result.library;

    const size_t total = tests.size();
    for (size_t i = 0; i < total; ++i) {
        const SourceFile& test = tests[i];
        const std::string name = display_name(test.path);

        if (compiler_.check_staleness(test, profile_) == Staleness::FRESH) {
            report(BuildPhase::COMPILING, ProgressLevel::DETAIL, name, "Up to date", i + 1, total);
        } else {
            report(BuildPhase::COMPILING, ProgressLevel::INFO, name, "Compiling " + name, i + 1, total);
        }

        CompileOutcome compiled = compiler_.compile(test, profile_);
        if (!compiled.ok()) {
            return add_error(result, BuildPhase::COMPILING, compiled.error);
        }
        if (compiled.invoked) {
            result.stats.compiled_units++;
        } else {
            result.stats.up_to_date_units++;
        }

        fs::path output = config_.test_executable_path(test.stem(), profile_);
        report(BuildPhase::LINKING_TESTS, ProgressLevel::INFO, display_name(output),
               "Linking " + display_name(output), i + 1, total);

        LinkOutcome linked = linker_.link_test(profile_, compiled.artifact, library,
                                               profile_.linker_flags);
        if (!linked.ok()) {
            result.stats.test_link_failures++;
            add_error(result, BuildPhase::LINKING_TESTS, linked.error);
            continue;
        }

        result.stats.tests_linked++;
        result.test_executables.push_back(linked.executable);
    }

    advance(result, ProfileState::TESTS_BUILT);
    return true;
}

bool BuildOrchestrator::stage_run_tests(BuildResult& result) {
    report(BuildPhase::RUNNING_TESTS, ProgressLevel::INFO, "", "Running tests...");

    TestRunner::Hooks hooks;
    hooks.on_start = [this](const fs::path& test, size_t index, size_t total) {
        report(BuildPhase::RUNNING_TESTS, ProgressLevel::INFO, display_name(test),
               "Running " + display_name(test), index + 1, total);
    };
    hooks.on_finish = [this](const TestResult& test) {
        if (test.passed) {
            report(BuildPhase::RUNNING_TESTS, ProgressLevel::PASS, test.name, "PASS");
        } else {
            report(BuildPhase::RUNNING_TESTS, ProgressLevel::FAIL, test.name,
                   "FAIL (exit " + std::to_string(test.exit_code) + ")",
                   0, 0, test.output);
        }
    };

    TestRunReport run = test_runner_.run_tests(hooks);
    if (!run.error.ok()) {
        return add_error(result, BuildPhase::RUNNING_TESTS, run.error);
    }

    if (run.results.empty()) {
        report(BuildPhase::RUNNING_TESTS, ProgressLevel::WARNING, config_.bin_root().string(),
               "no test executables found");
    }

    for (const auto& test : run.results) {
        if (!test.passed) {
            result.errors.emplace_back(ErrorKind::TEST_FAILURE, test.name,
                                       "exited with code " + std::to_string(test.exit_code),
                                       test.output);
        }
    }

    result.stats.tests_run = run.results.size();
    result.stats.tests_failed = run.failed_count();
    result.tests = std::move(run);
    advance(result, ProfileState::TESTS_RUN);
    return true;
}

// =============================================================================
// Helper Functions
// =============================================================================

void BuildOrchestrator::report(BuildPhase phase, ProgressLevel level,
                               const std::string& unit, const std::string& message,
                               size_t current, size_t total,
                               const std::string& diagnostics) {
    phase_ = phase;
    if (progress_cb_) {
        BuildProgress progress;
        progress.phase = phase;
        progress.level = level;
        progress.current = current;
        progress.total = total;
        progress.unit = unit;
        progress.message = message;
        progress.diagnostics = diagnostics;
        progress_cb_(progress);
    }
}

void BuildOrchestrator::report_error(BuildPhase phase, const BuildError& error) {
    report(phase, error.fatal() ? ProgressLevel::FAIL : ProgressLevel::WARNING,
           error.unit, error.describe(), 0, 0, error.diagnostics);
}

bool BuildOrchestrator::add_error(BuildResult& result, BuildPhase phase, BuildError error) {
    report_error(phase, error);
    bool recovered = !error.fatal();
    result.errors.push_back(std::move(error));
    return recovered;
}

void BuildOrchestrator::advance(BuildResult& result, ProfileState state) {
    if (state > result.state) {
        result.state = state;
    }
}

} // namespace spectre::make
