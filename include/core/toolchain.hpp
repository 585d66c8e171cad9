#pragma once

#include "core/process_runner.hpp"
#include "core/project_config.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace spectre::make {

/**
 * Toolchain - Invocation of the external C compiler and archiver
 *
 * Purpose: turn compile/archive/link requests into argument vectors for
 *          gcc/clang and ar, and run them through a ProcessRunner.
 *
 * The toolchain never interprets exit codes; callers decide whether a
 * nonzero exit is fatal (compile, archive, main link) or recoverable
 * (test link).
 */
class Toolchain {
public:
    using Result = ProcessRunner::Result;

    // Called with every command line just before it executes
    using CommandObserver = std::function<void(const std::vector<std::string>&)>;

    /**
     * Compilation of one source file into one object file
     *
     * Command: cc <flags...> -I<include>... -c <source> -o <object>
     */
    struct CompileTask {
        std::filesystem::path source;
        std::filesystem::path object;
        std::vector<std::string> flags;
        std::vector<std::filesystem::path> include_paths;
    };

    /**
     * Static library creation
     *
     * Command: ar rcs <library> <objects...>
     */
    struct ArchiveTask {
        std::filesystem::path library;
        std::vector<std::filesystem::path> objects;
    };

    /**
     * Executable link
     *
     * Command: cc <objects...> [<library>] <flags...> -o <output>
     * Flags follow the inputs so that -l libraries resolve their symbols.
     */
    struct LinkTask {
        std::vector<std::filesystem::path> objects;
        std::filesystem::path library;          // empty = none
        std::vector<std::string> flags;
        std::filesystem::path output;
    };

    explicit Toolchain(ToolchainConfig config, ProcessRunner runner = ProcessRunner{});

    Result compile(const CompileTask& task) const;
    Result archive(const ArchiveTask& task) const;
    Result link(const LinkTask& task) const;

    /**
     * First line of `cc --version`
     *
     * @throws std::runtime_error if the compiler cannot report a version
     */
    std::string get_version() const;

    void set_command_observer(CommandObserver observer) { observer_ = std::move(observer); }

    const ToolchainConfig& config() const { return config_; }

    // Argument builders (exposed for tests and verbose output)
    std::vector<std::string> build_compile_args(const CompileTask& task) const;
    std::vector<std::string> build_archive_args(const ArchiveTask& task) const;
    std::vector<std::string> build_link_args(const LinkTask& task) const;

private:
    ToolchainConfig config_;
    ProcessRunner runner_;
    CommandObserver observer_;

    Result execute(const std::vector<std::string>& args) const;
};

} // namespace spectre::make
