#ifndef SPECTRE_MAKE_ARTIFACT_HPP
#define SPECTRE_MAKE_ARTIFACT_HPP

// artifact.hpp - Inputs and build artifacts tracked by spectre_make
// Part of spectre_make - Spectre Build Orchestrator
//
// Sources are discovered, never mutated. Every artifact kind is produced or
// replaced by exactly one stage and persists on disk between invocations;
// that persistence is what makes incremental compilation possible.

#include "core/build_profile.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

namespace spectre::make {

namespace fs = std::filesystem;

// Logical group of a source file
enum class SourceGroup {
    LIBRARY,        // Archived into the static library and linked into the executable
    APPLICATION,    // Executable-only directory: linked into the executable, never archived
    TEST            // Compiled separately, linked one-by-one against the library
};

inline const char* source_group_to_string(SourceGroup group) {
    switch (group) {
        case SourceGroup::LIBRARY:     return "library";
        case SourceGroup::APPLICATION: return "application";
        case SourceGroup::TEST:        return "test";
        default:                       return "unknown";
    }
}

struct SourceFile {
    fs::path path;                  // Absolute path
    SourceGroup group = SourceGroup::LIBRARY;
    fs::file_time_type modified;    // Last-modified time at discovery

    std::string stem() const { return path.stem().string(); }

    // Stat a source file. On failure ec is set and modified is left at epoch.
    static SourceFile describe(const fs::path& path, SourceGroup group, std::error_code& ec) {
        SourceFile source;
        source.path = fs::absolute(path, ec);
        if (ec) {
            source.path = path;
            return source;
        }
        source.group = group;
        source.modified = fs::last_write_time(source.path, ec);
        return source;
    }
};

// Why an object is (or is not) rebuilt
enum class Staleness {
    FRESH,              // Object exists and is strictly newer than its source
    MISSING_OBJECT,     // No object at the target path
    SOURCE_NEWER        // Source modified at or after the object
};

inline const char* staleness_to_string(Staleness staleness) {
    switch (staleness) {
        case Staleness::FRESH:          return "fresh";
        case Staleness::MISSING_OBJECT: return "missing_object";
        case Staleness::SOURCE_NEWER:   return "source_newer";
        default:                        return "unknown";
    }
}

struct ObjectArtifact {
    fs::path path;          // build/<profile>/{obj|test_obj}/<stem>.o
    fs::path source;
    SourceGroup group = SourceGroup::LIBRARY;
    Profile profile = Profile::DEBUG;
};

struct LibraryArtifact {
    fs::path path;          // lib/lib<project>_<profile>.a
    Profile profile = Profile::DEBUG;
    size_t member_count = 0;
};

enum class ExecutableKind {
    MAIN,
    TEST
};

struct ExecutableArtifact {
    fs::path path;
    ExecutableKind kind = ExecutableKind::MAIN;
    Profile profile = Profile::DEBUG;
    fs::path alias;         // bin/<project>; empty for test executables
};

// Outcome of one test executable; exists only for one run-tests invocation
struct TestResult {
    std::string name;
    fs::path path;
    bool passed = false;
    int exit_code = 0;
    std::string output;     // Captured stdout followed by stderr
    std::chrono::milliseconds duration{0};
};

// Per-invocation counters
struct BuildStats {
    size_t compiled_units = 0;
    size_t up_to_date_units = 0;
    size_t tests_linked = 0;
    size_t test_link_failures = 0;
    size_t tests_run = 0;
    size_t tests_failed = 0;

    double cache_hit_rate() const {
        size_t total = compiled_units + up_to_date_units;
        if (total == 0) return 0.0;
        return static_cast<double>(up_to_date_units) / total;
    }
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_ARTIFACT_HPP
