#include "core/archiver.hpp"

#include <system_error>

namespace spectre::make {

Archiver::Archiver(const ProjectConfig& config, const Toolchain& toolchain)
    : config_(config)
    , toolchain_(toolchain)
{
}

fs::path Archiver::library_path(const BuildProfile& profile) const {
    return config_.library_path(profile);
}

ArchiveOutcome Archiver::archive(const BuildProfile& profile,
                                 const std::vector<ObjectArtifact>& objects) const {
    ArchiveOutcome outcome;
    outcome.library.path = library_path(profile);
    outcome.library.profile = profile.id;

    Toolchain::ArchiveTask task;
    task.library = outcome.library.path;
    for (const auto& object : objects) {
        if (object.group == SourceGroup::LIBRARY) {
            task.objects.push_back(object.path);
        }
    }

    if (task.objects.empty()) {
        outcome.error = BuildError(ErrorKind::ARCHIVE_FAILURE,
                                   outcome.library.path.string(),
                                   "no library objects to archive");
        return outcome;
    }

    std::error_code ec;
    fs::create_directories(outcome.library.path.parent_path(), ec);
    if (ec) {
        outcome.error = BuildError(ErrorKind::FILESYSTEM_ERROR,
                                   outcome.library.path.parent_path().string(),
                                   "cannot create library directory: " + ec.message());
        return outcome;
    }

    // `ar r` would keep members of objects that no longer exist
    fs::remove(outcome.library.path, ec);
    if (ec) {
        outcome.error = BuildError(ErrorKind::FILESYSTEM_ERROR,
                                   outcome.library.path.string(),
                                   "cannot remove previous library: " + ec.message());
        return outcome;
    }

    Toolchain::Result result = toolchain_.archive(task);
    if (!result.success()) {
        outcome.error = BuildError(ErrorKind::ARCHIVE_FAILURE,
                                   outcome.library.path.string(),
                                   "archiver exited with status " + std::to_string(result.exit_code),
                                   result.stderr_output);
        return outcome;
    }

    outcome.library.member_count = task.objects.size();
    return outcome;
}

} // namespace spectre::make
