/**
 * incremental_compiler.hpp
 * Staleness-based compilation of single source files
 *
 * An object is fresh iff it exists and its modification time is strictly
 * greater than its source's. Fresh objects are returned as-is without
 * spawning the compiler; everything else is recompiled.
 */

#ifndef SPECTRE_MAKE_INCREMENTAL_COMPILER_HPP
#define SPECTRE_MAKE_INCREMENTAL_COMPILER_HPP

#include "core/artifact.hpp"
#include "core/build_error.hpp"
#include "core/project_config.hpp"
#include "core/toolchain.hpp"

namespace spectre::make {

struct CompileOutcome {
    ObjectArtifact artifact;
    Staleness staleness = Staleness::MISSING_OBJECT;
    bool invoked = false;               // true if the compiler process ran
    std::chrono::milliseconds duration{0};
    BuildError error;

    bool ok() const { return error.ok(); }
};

class IncrementalCompiler {
public:
    IncrementalCompiler(const ProjectConfig& config, const Toolchain& toolchain);

    /**
     * Object path for a source under a profile:
     * build/<profile>/obj/<stem>.o, or build/<profile>/test_obj/<stem>.o for tests.
     */
    fs::path object_path(const SourceFile& source, const BuildProfile& profile) const;

    /**
     * Compare the object's modification time with the source's.
     */
    Staleness check_staleness(const SourceFile& source, const BuildProfile& profile) const;

    /**
     * Produce the object artifact for `source` under `profile`.
     *
     * Fresh objects: no toolchain invocation, invoked == false.
     * Stale objects: cc <profile flags> -I<include root> -I<source dir> -c <src> -o <obj>.
     * A nonzero compiler exit yields COMPILE_FAILURE carrying the captured
     * stderr; the caller must stop compiling further sources.
     */
    CompileOutcome compile(const SourceFile& source, const BuildProfile& profile) const;

private:
    const ProjectConfig& config_;
    const Toolchain& toolchain_;
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_INCREMENTAL_COMPILER_HPP
