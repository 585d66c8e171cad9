#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace spectre::make {

/**
 * ProcessRunner - Spawns external programs and captures their output
 *
 * Responsibilities:
 * - Fork/exec a program with an explicit argument vector (no shell)
 * - Capture stdout and stderr through separate pipes
 * - Wait for completion and translate the wait status into an exit code
 * - Measure wall-clock duration
 *
 * Every call blocks until the child exits. There is no timeout: a hung
 * child blocks the caller indefinitely.
 *
 * Platform Support: POSIX (fork/execvp/pipe/select)
 */
class ProcessRunner {
public:
    /**
     * Result of one process execution
     */
    struct Result {
        int exit_code = -1;                     // 0 = success, 128+N = killed by signal N
        std::string stdout_output;
        std::string stderr_output;
        std::chrono::milliseconds duration{0};

        bool success() const { return exit_code == 0; }

        /**
         * stdout followed by stderr, for diagnostics that mix both streams
         */
        std::string combined_output() const;
    };

    // Per-stream capture limit; output beyond it is drained and discarded
    static constexpr size_t MAX_CAPTURE_BYTES = 10 * 1024 * 1024;

    /**
     * Execute a program and capture its output
     *
     * Process:
     * 1. Create stdout/stderr pipes
     * 2. Fork; in the child redirect both streams, chdir, execvp
     * 3. In the parent drain both pipes until EOF
     * 4. Reap the child and decode its status
     *
     * @param args Program followed by its arguments (args[0] searched in PATH)
     * @param working_dir Directory for the child; empty = inherit
     * @return Result with exit code, output and timing
     * @throws std::runtime_error on pipe/fork failure (not on nonzero exit).
     *         An exec failure is reported as exit code 127.
     */
    Result run(const std::vector<std::string>& args,
               const std::filesystem::path& working_dir = {}) const;
};

/**
 * Render an argument vector as a single command line for logging
 */
std::string format_command(const std::vector<std::string>& args);

} // namespace spectre::make
