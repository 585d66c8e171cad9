#ifndef SPECTRE_MAKE_LINKER_HPP
#define SPECTRE_MAKE_LINKER_HPP

#include "core/artifact.hpp"
#include "core/build_error.hpp"
#include "core/project_config.hpp"
#include "core/toolchain.hpp"

#include <string>
#include <vector>

namespace spectre::make {

struct LinkOutcome {
    ExecutableArtifact executable;
    BuildError error;

    bool ok() const { return error.ok(); }
};

/**
 * Produces the main executable and the per-test executables.
 *
 * Failure semantics differ on purpose: a failed main link is fatal
 * (LINK_FAILURE), a failed test link is recorded as TEST_LINK_FAILURE and
 * the caller moves on to the next test.
 */
class Linker {
public:
    Linker(const ProjectConfig& config, const Toolchain& toolchain);

    /**
     * Link every non-test object into bin/<project>_<profile>, set mode 0755,
     * then repoint bin/<project> at it.
     */
    LinkOutcome link_executable(const BuildProfile& profile,
                                const std::vector<ObjectArtifact>& objects,
                                const std::vector<std::string>& link_flags) const;

    /**
     * Link one test object against the profile's library into
     * bin/<test-stem>_<profile>.
     */
    LinkOutcome link_test(const BuildProfile& profile,
                          const ObjectArtifact& test_object,
                          const LibraryArtifact& library,
                          const std::vector<std::string>& link_flags) const;

private:
    const ProjectConfig& config_;
    const Toolchain& toolchain_;

    BuildError ensure_bin_dir() const;

    // Relative symlink created under a temporary name, then renamed over the
    // previous alias so the alias path is never missing.
    BuildError publish_alias(const fs::path& executable) const;
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_LINKER_HPP
