/**
 * Source Discovery for spectre_make
 *
 * Recursively enumerates compilable source files under the source root and
 * the test root. The two roots are always scanned by separate calls and
 * their results never merged: test sources are linked one-by-one against
 * the library instead of being bundled into it.
 *
 * Features:
 * - Extension predicate (".c" by default)
 * - Canonical sorting for reproducible compile and link order
 * - Classification of executable-only directories (e.g. src/apps)
 * - Object-name collision detection
 */

#ifndef SPECTRE_MAKE_SOURCE_DISCOVERY_HPP
#define SPECTRE_MAKE_SOURCE_DISCOVERY_HPP

#include "core/artifact.hpp"
#include "core/project_config.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spectre::make::discovery {

namespace fs = std::filesystem;

/**
 * Error codes from discovery
 */
enum class DiscoveryError {
    OK = 0,
    NOT_A_DIRECTORY = 1,
    ACCESS_DENIED = 2,
    FILESYSTEM_ERROR = 3
};

/**
 * Result of a discovery pass
 */
struct DiscoveryResult {
    std::vector<SourceFile> sources;
    bool root_exists = true;        // false: root missing, sources empty, not an error
    DiscoveryError error = DiscoveryError::OK;
    std::string error_message;

    bool ok() const { return error == DiscoveryError::OK; }
};

using PathPredicate = std::function<bool(const fs::path&)>;

/**
 * Predicate accepting files whose extension is one of `extensions`
 * (compared with the leading dot, case-sensitive).
 */
PathPredicate has_extension(std::vector<std::string> extensions);

/**
 * Enumerate regular files under `root` accepted by `predicate`.
 *
 * @param root Directory to traverse recursively (symlinked dirs not followed)
 * @param predicate File filter
 * @param classify Maps each accepted path to its logical group
 * @return Sorted sources, or an error
 */
DiscoveryResult discover(
    const fs::path& root,
    const PathPredicate& predicate,
    const std::function<SourceGroup(const fs::path&)>& classify
);

/**
 * Library and application sources under the project's source root.
 */
DiscoveryResult discover_project_sources(const ProjectConfig& config);

/**
 * Test sources under the project's test root.
 */
DiscoveryResult discover_test_sources(const ProjectConfig& config);

/**
 * Two sources that would produce the same object file
 */
struct ObjectCollision {
    fs::path first;
    fs::path second;
    std::string object_name;
};

/**
 * Find the first pair of sources sharing an object name.
 * Object names derive from the stem alone, so src/a/util.c and
 * src/b/util.c collide.
 */
std::optional<ObjectCollision> find_object_collision(const std::vector<SourceFile>& sources);

/**
 * Get human-readable error string.
 */
const char* error_string(DiscoveryError error);

} // namespace spectre::make::discovery

#endif // SPECTRE_MAKE_SOURCE_DISCOVERY_HPP
