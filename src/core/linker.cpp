#include "core/linker.hpp"

#include <system_error>

namespace spectre::make {

Linker::Linker(const ProjectConfig& config, const Toolchain& toolchain)
    : config_(config)
    , toolchain_(toolchain)
{
}

BuildError Linker::ensure_bin_dir() const {
    std::error_code ec;
    fs::create_directories(config_.bin_root(), ec);
    if (ec) {
        return BuildError(ErrorKind::FILESYSTEM_ERROR, config_.bin_root().string(),
                          "cannot create executable directory: " + ec.message());
    }
    return BuildError{};
}

LinkOutcome Linker::link_executable(const BuildProfile& profile,
                                    const std::vector<ObjectArtifact>& objects,
                                    const std::vector<std::string>& link_flags) const {
    LinkOutcome outcome;
    outcome.executable.path = config_.executable_path(profile);
    outcome.executable.kind = ExecutableKind::MAIN;
    outcome.executable.profile = profile.id;

    outcome.error = ensure_bin_dir();
    if (!outcome.error.ok()) {
        return outcome;
    }

    Toolchain::LinkTask task;
    for (const auto& object : objects) {
        if (object.group != SourceGroup::TEST) {
            task.objects.push_back(object.path);
        }
    }
    task.flags = link_flags;
    task.output = outcome.executable.path;

    if (task.objects.empty()) {
        outcome.error = BuildError(ErrorKind::LINK_FAILURE, outcome.executable.path.string(),
                                   "no objects to link");
        return outcome;
    }

    Toolchain::Result result = toolchain_.link(task);
    if (!result.success()) {
        outcome.error = BuildError(ErrorKind::LINK_FAILURE,
                                   outcome.executable.path.string(),
                                   "linker exited with status " + std::to_string(result.exit_code),
                                   result.stderr_output);
        return outcome;
    }

    std::error_code ec;
    fs::permissions(outcome.executable.path,
                    fs::perms::owner_all |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    ec);
    if (ec) {
        outcome.error = BuildError(ErrorKind::FILESYSTEM_ERROR,
                                   outcome.executable.path.string(),
                                   "cannot mark executable: " + ec.message());
        return outcome;
    }

    outcome.error = publish_alias(outcome.executable.path);
    if (outcome.error.ok()) {
        outcome.executable.alias = config_.alias_path();
    }
    return outcome;
}

LinkOutcome Linker::link_test(const BuildProfile& profile,
                              const ObjectArtifact& test_object,
                              const LibraryArtifact& library,
                              const std::vector<std::string>& link_flags) const {
    LinkOutcome outcome;
    outcome.executable.path = config_.test_executable_path(test_object.path.stem().string(), profile);
    outcome.executable.kind = ExecutableKind::TEST;
    outcome.executable.profile = profile.id;

    BuildError dir_error = ensure_bin_dir();
    if (!dir_error.ok()) {
        outcome.error = BuildError(ErrorKind::TEST_LINK_FAILURE, outcome.executable.path.string(),
                                   dir_error.message);
        return outcome;
    }

    Toolchain::LinkTask task;
    task.objects = {test_object.path};
    task.library = library.path;
    task.flags = link_flags;
    task.output = outcome.executable.path;

    Toolchain::Result result = toolchain_.link(task);
    if (!result.success()) {
        outcome.error = BuildError(ErrorKind::TEST_LINK_FAILURE,
                                   outcome.executable.path.string(),
                                   "linker exited with status " + std::to_string(result.exit_code),
                                   result.stderr_output);
    }

    return outcome;
}

BuildError Linker::publish_alias(const fs::path& executable) const {
    const fs::path alias = config_.alias_path();
    const fs::path staging = alias.string() + ".tmp";

    std::error_code ec;
    fs::remove(staging, ec);
    if (ec) {
        return BuildError(ErrorKind::FILESYSTEM_ERROR, staging.string(),
                          "cannot remove stale alias: " + ec.message());
    }

    // Target is relative to bin/
    fs::create_symlink(executable.filename(), staging, ec);
    if (ec) {
        return BuildError(ErrorKind::FILESYSTEM_ERROR, alias.string(),
                          "cannot create alias: " + ec.message());
    }

    fs::rename(staging, alias, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return BuildError(ErrorKind::FILESYSTEM_ERROR, alias.string(),
                          "cannot replace alias: " + ec.message());
    }

    return BuildError{};
}

} // namespace spectre::make
