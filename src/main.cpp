/**
 * main.cpp
 * spectre_make - Spectre Build Orchestrator CLI
 *
 * Usage:
 *   spectre_make <action> [options]
 *
 * Actions:
 *   all         Build library, executable and tests (tests are not run)
 *   library     Build the static library
 *   executable  Build the main executable and update the alias
 *   tests       Build every test executable
 *   run-tests   Run the test executables found in bin/
 *   clean       Remove all build artifacts
 *
 * Options:
 *   --config <name>  Build profile: debug, release, profile (default: debug)
 *   --clean          Clean before the action
 *   -C <dir>         Project root (default: current directory)
 *   -f <file>        Project file (default: build.smk, optional)
 *   -v               Verbose output
 *   -q               Quiet mode
 *   --help           Show this help
 *   --version        Show version
 */

#include "config/project_file.hpp"
#include "core/build_orchestrator.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace spectre::make;

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version(const ToolchainConfig& toolchain_config) {
    std::cout << "spectre_make 0.1.0\n";
    std::cout << "Spectre Build Orchestrator\n";

    Toolchain toolchain(toolchain_config);
    try {
        std::cout << "Compiler: " << toolchain.get_version() << "\n";
    } catch (const std::runtime_error& e) {
        std::cout << "Compiler: unavailable (" << e.what() << ")\n";
    }
}

void print_help() {
    std::cout << R"(
spectre_make - Spectre Build Orchestrator

USAGE:
    spectre_make <ACTION> [OPTIONS]

ACTIONS:
    all             Build library, executable and tests (tests are not run)
    library         Build lib/lib<project>_<profile>.a
    executable      Build bin/<project>_<profile> and point bin/<project> at it
    tests           Build one bin/<test>_<profile> per test source
    run-tests       Run every test executable in bin/
    clean           Remove build/, bin/, lib/ and stray *.o / *.a files

OPTIONS:
    --config <name> Build profile: debug, release or profile (default: debug)
    --clean         Clean before running the action
    -C <dir>        Use <dir> as the project root
    -f <file>       Use specified project file (default: build.smk)
    -v, --verbose   Verbose output (show all commands)
    -q, --quiet     Quiet mode (errors only)

    -h, --help      Show this help message
    --version       Show version information

EXAMPLES:
    spectre_make all                      Debug build of everything
    spectre_make executable --config release
    spectre_make tests --clean            Rebuild tests from scratch
    spectre_make run-tests                Run all built tests

PROJECT FILE FORMAT (build.smk):
    [project]
    name = "spectre"
    sources = "src"
    tests = "tests"

    [toolchain]
    compiler = "gcc"

    [profile.release]
    cflags = ["-Wall", "-O3", "-DNDEBUG"]
    ldflags = ["-lm", "-pthread", "-flto"]

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleProgress {
public:
    explicit ConsoleProgress(bool verbose = false, bool quiet = false)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(const BuildProgress& progress) {
        switch (progress.level) {
            case ProgressLevel::FAIL:
                std::cerr << "FAIL " << progress.message << "\n";
                print_diagnostics(progress);
                return;

            case ProgressLevel::WARNING:
                std::cerr << "warning: " << progress.message;
                if (!progress.unit.empty() && progress.message.find(progress.unit) == std::string::npos) {
                    std::cerr << " (" << progress.unit << ")";
                }
                std::cerr << "\n";
                if (verbose_) {
                    print_diagnostics(progress);
                }
                return;

            default:
                break;
        }

        if (quiet_) return;

        switch (progress.level) {
            case ProgressLevel::COMMAND:
                if (verbose_) {
                    std::cout << "[CMD] " << progress.message << "\n";
                }
                break;

            case ProgressLevel::DETAIL:
                if (verbose_) {
                    std::cout << "      " << progress.message;
                    if (!progress.unit.empty()) {
                        std::cout << ": " << progress.unit;
                    }
                    std::cout << "\n";
                }
                break;

            case ProgressLevel::PASS:
                std::cout << "PASS " << progress.unit << "\n";
                break;

            case ProgressLevel::INFO:
                if (progress.phase == BuildPhase::COMPLETE) {
                    // Reported separately
                    break;
                }
                if (progress.total > 0) {
                    std::cout << "[" << progress.current << "/" << progress.total << "] ";
                }
                std::cout << progress.message << "\n";
                break;

            default:
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;

    static void print_diagnostics(const BuildProgress& progress) {
        if (progress.diagnostics.empty()) return;
        std::cerr << progress.diagnostics;
        if (progress.diagnostics.back() != '\n') {
            std::cerr << "\n";
        }
    }
};

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

struct Options {
    std::optional<BuildAction> action;
    std::string profile = "debug";
    bool clean_first = false;
    fs::path project_root;
    fs::path project_file;          // empty = default, optional
    bool verbose = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

bool parse_args(int argc, char* argv[], Options& opts) {
    opts.project_root = fs::current_path();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            continue;
        }

        // Options with arguments
        if (arg == "--config" || arg == "-C" || arg == "-f") {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires an argument\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                opts.profile = value;
            } else if (arg == "-C") {
                opts.project_root = value;
            } else {
                opts.project_file = value;
            }
            continue;
        }
        if (arg.compare(0, 9, "--config=") == 0) {
            opts.profile = arg.substr(9);
            continue;
        }

        // Boolean options
        if (arg == "--clean") {
            opts.clean_first = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
            continue;
        }

        // Unknown option
        if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Try 'spectre_make --help' for more information.\n";
            return false;
        }

        // Action
        if (opts.action) {
            std::cerr << "Only one action may be given (got '" << action_name(*opts.action)
                      << "' and '" << arg << "')\n";
            return false;
        }
        opts.action = parse_action(arg);
        if (!opts.action) {
            std::cerr << "Unknown action: " << arg << "\n";
            std::cerr << "Try 'spectre_make --help' for more information.\n";
            return false;
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------

bool load_config(const Options& opts, ProjectConfig& config) {
    std::error_code ec;
    config.project_root = fs::absolute(opts.project_root, ec);
    if (ec || !fs::is_directory(config.project_root, ec)) {
        std::cerr << "Error: project root is not a directory: " << opts.project_root.string() << "\n";
        return false;
    }

    bool required = !opts.project_file.empty();
    fs::path file = required ? opts.project_file
                             : config.project_root / config::DEFAULT_PROJECT_FILE;

    config::ProjectFileResult loaded = config::load_project_file(file, required, config);
    for (const auto& warning : loaded.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }
    if (!loaded.ok()) {
        std::cerr << "Error: " << loaded.error.describe() << "\n";
        return false;
    }

    // Command line wins over the project file
    config.verbose = opts.verbose;
    config.quiet = opts.quiet;
    return true;
}

// -----------------------------------------------------------------------------
// Summary
// -----------------------------------------------------------------------------

void print_summary(BuildAction action, const BuildResult& result, bool quiet) {
    if (result.build_failed()) {
        std::cerr << "\nBuild failed";
        for (const auto& err : result.errors) {
            if (err.fatal()) {
                std::cerr << ": " << err.describe();
                break;
            }
        }
        std::cerr << "\n";
        return;
    }

    if (action == BuildAction::RUN_TESTS && result.tests) {
        const TestRunReport& tests = *result.tests;
        if (!tests.all_passed) {
            std::cerr << "\nTests failed: " << tests.failed_count() << " of "
                      << tests.results.size() << "\n";
            for (const auto& name : tests.failed_names()) {
                std::cerr << "  " << name << "\n";
            }
            return;
        }
        if (!quiet) {
            std::cout << "\nAll tests passed (" << tests.results.size() << " run, "
                      << result.total_time.count() << "ms)\n";
        }
        return;
    }

    if (quiet) return;

    if (action == BuildAction::CLEAN) {
        std::cout << "Clean complete.\n";
        return;
    }

    const BuildStats& stats = result.stats;
    std::cout << "\nBuild succeeded: "
              << stats.compiled_units << " compiled, "
              << stats.up_to_date_units << " up-to-date";
    if (stats.compiled_units + stats.up_to_date_units > 0) {
        std::cout << " (" << std::fixed << std::setprecision(0)
                  << stats.cache_hit_rate() * 100.0 << "% cached)";
    }
    if (stats.tests_linked > 0 || stats.test_link_failures > 0) {
        std::cout << ", " << stats.tests_linked << " tests linked";
    }
    if (stats.test_link_failures > 0) {
        std::cout << ", " << stats.test_link_failures << " failed to link";
    }
    std::cout << " (" << result.total_time.count() << "ms)\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    ProjectConfig config;
    if (!load_config(opts, config)) {
        return 1;
    }

    if (opts.show_version) {
        print_version(config.toolchain);
        return 0;
    }

    if (!opts.action) {
        std::cerr << "No action given.\n";
        std::cerr << "Try 'spectre_make --help' for more information.\n";
        return 1;
    }

    // The profile is validated before any work, clean included
    ProfileLookup lookup = config.profiles.lookup(opts.profile);
    if (!lookup.ok()) {
        std::cerr << "Error: " << lookup.error.describe() << "\n";
        return 1;
    }

    BuildOrchestrator orchestrator(config, lookup.profile);
    orchestrator.set_progress_callback(ConsoleProgress(config.verbose, config.quiet));

    if (!config.quiet) {
        std::cout << "spectre_make " << action_name(*opts.action)
                  << " [" << lookup.profile.name << "]\n";
    }

    BuildResult result = orchestrator.execute(*opts.action, opts.clean_first);
    print_summary(*opts.action, result, config.quiet);

    return result.success ? 0 : 1;
}
