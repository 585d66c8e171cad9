#ifndef SPECTRE_MAKE_WORKSPACE_HPP
#define SPECTRE_MAKE_WORKSPACE_HPP

// workspace.hpp - Creation and teardown of the artifact tree
// Part of spectre_make - Spectre Build Orchestrator

#include "core/build_error.hpp"
#include "core/project_config.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace spectre::make {

namespace fs = std::filesystem;

struct SetupReport {
    std::vector<fs::path> created;      // Roots that did not exist before
    BuildError error;

    bool ok() const { return error.ok(); }
};

struct CleanReport {
    std::vector<fs::path> removed_roots;
    std::vector<fs::path> removed_strays;   // *.o / *.a outside the roots
    BuildError error;

    bool ok() const { return error.ok(); }
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(const ProjectConfig& config);

    // Idempotent: existing roots are left untouched
    SetupReport setup() const;

    // Irreversible. Removes build/, bin/ and lib/, then every *.o and *.a
    // file under the project root. Symlinked directories are not followed.
    CleanReport clean() const;

private:
    const ProjectConfig& config_;

    std::vector<fs::path> roots() const;
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_WORKSPACE_HPP
