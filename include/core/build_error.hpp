#ifndef SPECTRE_MAKE_BUILD_ERROR_HPP
#define SPECTRE_MAKE_BUILD_ERROR_HPP

// build_error.hpp - Error taxonomy for spectre_make
// Part of spectre_make - Spectre Build Orchestrator
//
// Stages never terminate the process. Every failure is described by a
// BuildError value and returned up to the CLI, which alone decides the
// exit code. Only process creation failures are thrown (std::runtime_error).

#include <string>
#include <utility>

namespace spectre::make {

enum class ErrorKind {
    NONE,
    UNKNOWN_PROFILE,          // Requested configuration not registered
    COMPILE_FAILURE,          // Compiler exited nonzero (fatal)
    ARCHIVE_FAILURE,          // Archiver exited nonzero (fatal)
    LINK_FAILURE,             // Main executable link failed (fatal)
    TEST_LINK_FAILURE,        // One test executable failed to link (recovered)
    TEST_FAILURE,             // A test binary exited nonzero (recovered)
    OBJECT_NAME_COLLISION,    // Two sources map onto one object path (fatal)
    FILESYSTEM_ERROR,         // Directory creation/removal/traversal failed
    CONFIG_ERROR,             // Malformed project file
    SYSTEM_ERROR              // fork/pipe failure or unexpected exception
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                  return "none";
        case ErrorKind::UNKNOWN_PROFILE:       return "unknown_profile";
        case ErrorKind::COMPILE_FAILURE:       return "compile_failure";
        case ErrorKind::ARCHIVE_FAILURE:       return "archive_failure";
        case ErrorKind::LINK_FAILURE:          return "link_failure";
        case ErrorKind::TEST_LINK_FAILURE:     return "test_link_failure";
        case ErrorKind::TEST_FAILURE:          return "test_failure";
        case ErrorKind::OBJECT_NAME_COLLISION: return "object_name_collision";
        case ErrorKind::FILESYSTEM_ERROR:      return "filesystem_error";
        case ErrorKind::CONFIG_ERROR:          return "config_error";
        case ErrorKind::SYSTEM_ERROR:          return "system_error";
        default:                               return "unknown";
    }
}

// Recovered errors are recorded and only influence the aggregate result.
inline bool is_fatal(ErrorKind kind) {
    return kind != ErrorKind::NONE
        && kind != ErrorKind::TEST_LINK_FAILURE
        && kind != ErrorKind::TEST_FAILURE;
}

struct BuildError {
    ErrorKind kind = ErrorKind::NONE;
    std::string unit;           // Source, library or executable concerned
    std::string message;        // One-line summary
    std::string diagnostics;    // Captured toolchain output, verbatim

    BuildError() = default;
    BuildError(ErrorKind k, std::string u, std::string msg, std::string diag = "")
        : kind(k), unit(std::move(u)), message(std::move(msg)), diagnostics(std::move(diag)) {}

    bool ok() const { return kind == ErrorKind::NONE; }
    bool fatal() const { return is_fatal(kind); }

    // "<kind>: <unit>: <message>" without diagnostics
    std::string describe() const {
        std::string text = error_kind_to_string(kind);
        if (!unit.empty()) {
            text += ": " + unit;
        }
        if (!message.empty()) {
            text += ": " + message;
        }
        return text;
    }
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_BUILD_ERROR_HPP
