/**
 * project_file.hpp
 * Optional project file (build.smk) for spectre_make
 *
 * Format:
 *   # comment            ; comment
 *   [project]
 *   name = "spectre"
 *   sources = "src"
 *   tests = "tests"
 *   include = "include"
 *   extensions = [".c"]
 *   executable_only = ["apps"]
 *
 *   [toolchain]
 *   compiler = "gcc"
 *   archiver = "ar"
 *
 *   [tests]
 *   prefixes = ["test_", "unit_", "integration_"]
 *
 *   [profile.release]
 *   cflags = ["-O3", "-DNDEBUG"]
 *   ldflags = ["-lm", "-pthread", "-flto"]
 *
 * Unknown sections and keys produce warnings. Structural errors and
 * [profile.X] sections naming an unregistered profile are fatal.
 */

#ifndef SPECTRE_MAKE_PROJECT_FILE_HPP
#define SPECTRE_MAKE_PROJECT_FILE_HPP

#include "core/build_error.hpp"
#include "core/project_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace spectre::make::config {

namespace fs = std::filesystem;

constexpr const char* DEFAULT_PROJECT_FILE = "build.smk";

struct ProjectFileResult {
    bool found = false;
    BuildError error;
    std::vector<std::string> warnings;

    bool ok() const { return error.ok(); }
};

/**
 * Apply the settings in `content` to `config`.
 * `config` is left untouched unless parsing succeeds.
 *
 * @param origin Name used in messages (usually the file path)
 */
ProjectFileResult parse_project_file(const std::string& content,
                                     const std::string& origin,
                                     ProjectConfig& config);

/**
 * Read and apply a project file.
 *
 * @param required false: a missing file is not an error (found == false)
 */
ProjectFileResult load_project_file(const fs::path& path,
                                    bool required,
                                    ProjectConfig& config);

} // namespace spectre::make::config

#endif // SPECTRE_MAKE_PROJECT_FILE_HPP
