#ifndef SPECTRE_MAKE_ARCHIVER_HPP
#define SPECTRE_MAKE_ARCHIVER_HPP

#include "core/artifact.hpp"
#include "core/build_error.hpp"
#include "core/project_config.hpp"
#include "core/toolchain.hpp"

#include <vector>

namespace spectre::make {

struct ArchiveOutcome {
    LibraryArtifact library;
    BuildError error;

    bool ok() const { return error.ok(); }
};

// Builds lib/lib<project>_<profile>.a from the library-group objects.
// The archive is always deleted and recreated; members are never diffed.
class Archiver {
public:
    Archiver(const ProjectConfig& config, const Toolchain& toolchain);

    fs::path library_path(const BuildProfile& profile) const;

    // Objects outside the library group are ignored. An empty library
    // group or a nonzero archiver exit yields ARCHIVE_FAILURE.
    ArchiveOutcome archive(const BuildProfile& profile,
                           const std::vector<ObjectArtifact>& objects) const;

private:
    const ProjectConfig& config_;
    const Toolchain& toolchain_;
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_ARCHIVER_HPP
