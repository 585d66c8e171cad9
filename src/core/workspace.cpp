// workspace.cpp - Workspace Manager implementation
// Part of spectre_make - Spectre Build Orchestrator

#include "core/workspace.hpp"

#include <cstdint>
#include <system_error>

namespace spectre::make {

namespace {

bool is_stray_artifact(const fs::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".o" || ext == ".a";
}

} // namespace

WorkspaceManager::WorkspaceManager(const ProjectConfig& config)
    : config_(config) {
}

std::vector<fs::path> WorkspaceManager::roots() const {
    return {config_.build_root(), config_.bin_root(), config_.lib_root()};
}

SetupReport WorkspaceManager::setup() const {
    SetupReport report;

    for (const auto& root : roots()) {
        std::error_code ec;
        bool created = fs::create_directories(root, ec);
        if (ec) {
            report.error = BuildError(ErrorKind::FILESYSTEM_ERROR, root.string(),
                                      "cannot create directory: " + ec.message());
            return report;
        }
        if (created) {
            report.created.push_back(root);
        }
    }

    return report;
}

CleanReport WorkspaceManager::clean() const {
    CleanReport report;
    std::error_code ec;

    // Remove build output roots
    for (const auto& root : roots()) {
        std::uintmax_t removed = fs::remove_all(root, ec);
        if (ec) {
            report.error = BuildError(ErrorKind::FILESYSTEM_ERROR, root.string(),
                                      "cannot remove directory: " + ec.message());
            return report;
        }
        if (removed > 0) {
            report.removed_roots.push_back(root);
        }
    }

    // Sweep stray objects and archives left by older invocations.
    // Collected first: removing entries mid-iteration is unspecified.
    std::vector<fs::path> strays;
    fs::recursive_directory_iterator it(config_.project_root, fs::directory_options::none, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        fs::file_status status = it->symlink_status(entry_ec);
        if (entry_ec || fs::is_directory(status)) {
            continue;
        }
        if (is_stray_artifact(it->path())) {
            strays.push_back(it->path());
        }
    }
    if (ec) {
        report.error = BuildError(ErrorKind::FILESYSTEM_ERROR, config_.project_root.string(),
                                  "cannot scan project: " + ec.message());
        return report;
    }

    for (const auto& stray : strays) {
        fs::remove(stray, ec);
        if (ec) {
            report.error = BuildError(ErrorKind::FILESYSTEM_ERROR, stray.string(),
                                      "cannot remove file: " + ec.message());
            return report;
        }
        report.removed_strays.push_back(stray);
    }

    return report;
}

} // namespace spectre::make
