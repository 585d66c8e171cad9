/**
 * incremental_compiler.cpp
 */

#include "core/incremental_compiler.hpp"

#include <system_error>

namespace spectre::make {

IncrementalCompiler::IncrementalCompiler(const ProjectConfig& config, const Toolchain& toolchain)
    : config_(config)
    , toolchain_(toolchain)
{
}

fs::path IncrementalCompiler::object_path(const SourceFile& source, const BuildProfile& profile) const {
    fs::path dir = source.group == SourceGroup::TEST
        ? config_.test_object_dir(profile)
        : config_.object_dir(profile);
    return dir / (source.stem() + ".o");
}

Staleness IncrementalCompiler::check_staleness(const SourceFile& source, const BuildProfile& profile) const {
    std::error_code ec;
    fs::file_time_type object_time = fs::last_write_time(object_path(source, profile), ec);
    if (ec) {
        return Staleness::MISSING_OBJECT;
    }

    // Equal timestamps count as stale
    if (object_time > source.modified) {
        return Staleness::FRESH;
    }
    return Staleness::SOURCE_NEWER;
}

CompileOutcome IncrementalCompiler::compile(const SourceFile& source, const BuildProfile& profile) const {
    CompileOutcome outcome;
    outcome.artifact.path = object_path(source, profile);
    outcome.artifact.source = source.path;
    outcome.artifact.group = source.group;
    outcome.artifact.profile = profile.id;

    outcome.staleness = check_staleness(source, profile);
    if (outcome.staleness == Staleness::FRESH) {
        return outcome;
    }

    std::error_code ec;
    fs::create_directories(outcome.artifact.path.parent_path(), ec);
    if (ec) {
        outcome.error = BuildError(ErrorKind::FILESYSTEM_ERROR,
                                   outcome.artifact.path.parent_path().string(),
                                   "cannot create object directory: " + ec.message());
        return outcome;
    }

    Toolchain::CompileTask task;
    task.source = source.path;
    task.object = outcome.artifact.path;
    task.flags = profile.compiler_flags;
    task.include_paths = {config_.include_root(), source.path.parent_path()};

    Toolchain::Result result = toolchain_.compile(task);
    outcome.invoked = true;
    outcome.duration = result.duration;

    if (!result.success()) {
        outcome.error = BuildError(ErrorKind::COMPILE_FAILURE,
                                   source.path.string(),
                                   "compiler exited with status " + std::to_string(result.exit_code),
                                   result.stderr_output);
    }

    return outcome;
}

} // namespace spectre::make
