/**
 * project_config.hpp
 * Immutable project configuration for spectre_make
 *
 * Built once at startup from defaults, then the optional project file, then
 * command-line flags. Every stage receives it by const reference; no stage
 * keeps mutable build settings of its own.
 *
 * Output layout (per profile <p>):
 *   build/<p>/obj/*.o          library and application objects
 *   build/<p>/test_obj/*.o     test objects
 *   lib/lib<project>_<p>.a     static library
 *   bin/<project>_<p>          main executable
 *   bin/<project>              alias to the last linked main executable
 *   bin/<test-stem>_<p>        one per test source
 */

#ifndef SPECTRE_MAKE_PROJECT_CONFIG_HPP
#define SPECTRE_MAKE_PROJECT_CONFIG_HPP

#include "core/build_profile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace spectre::make {

namespace fs = std::filesystem;

constexpr const char* BUILD_DIR = "build";
constexpr const char* BIN_DIR = "bin";
constexpr const char* LIB_DIR = "lib";

// Compiler used when neither the project file nor the CLI names one
std::string default_compiler();

struct ToolchainConfig {
    std::string compiler = default_compiler();
    std::string archiver = "ar";
};

struct ProjectConfig {
    // Project root directory; relative roots below resolve against it
    fs::path project_root;

    // Used for lib<project>_<p>.a, <project>_<p> and the alias
    std::string project_name = "spectre";

    // Input roots
    fs::path source_dir = "src";
    fs::path test_dir = "tests";
    fs::path include_dir = "include";

    std::vector<std::string> source_extensions = {".c"};

    // Directories under the source root whose sources are linked into the
    // executable but not archived into the library
    std::vector<std::string> executable_only_dirs = {"apps"};

    // Name prefixes identifying test executables in bin/
    std::vector<std::string> test_prefixes = {"test_", "unit_", "integration_"};

    ToolchainConfig toolchain;
    ProfileRegistry profiles = ProfileRegistry::defaults();

    bool verbose = false;   // Echo toolchain commands
    bool quiet = false;     // Suppress progress lines

    // =========================================================================
    // Derived paths
    // =========================================================================

    fs::path source_root() const { return project_root / source_dir; }
    fs::path test_root() const { return project_root / test_dir; }
    fs::path include_root() const { return project_root / include_dir; }

    // Output roots are fixed; clean removes them wholesale
    fs::path build_root() const { return project_root / BUILD_DIR; }
    fs::path bin_root() const { return project_root / BIN_DIR; }
    fs::path lib_root() const { return project_root / LIB_DIR; }

    fs::path object_dir(const BuildProfile& profile) const {
        return build_root() / profile.name / "obj";
    }

    fs::path test_object_dir(const BuildProfile& profile) const {
        return build_root() / profile.name / "test_obj";
    }

    fs::path library_path(const BuildProfile& profile) const {
        return lib_root() / ("lib" + project_name + "_" + profile.name + ".a");
    }

    fs::path executable_path(const BuildProfile& profile) const {
        return bin_root() / (project_name + "_" + profile.name);
    }

    fs::path alias_path() const {
        return bin_root() / project_name;
    }

    fs::path test_executable_path(const std::string& test_stem, const BuildProfile& profile) const {
        return bin_root() / (test_stem + "_" + profile.name);
    }
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_PROJECT_CONFIG_HPP
