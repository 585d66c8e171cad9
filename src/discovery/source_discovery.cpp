/**
 * Source Discovery Implementation
 */

#include "discovery/source_discovery.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_map>

namespace spectre::make::discovery {

namespace {

DiscoveryError classify_error(const std::error_code& ec) {
    if (ec == std::errc::permission_denied) {
        return DiscoveryError::ACCESS_DENIED;
    }
    return DiscoveryError::FILESYSTEM_ERROR;
}

DiscoveryResult failure(DiscoveryError error, const fs::path& where, const std::string& detail) {
    DiscoveryResult result;
    result.error = error;
    result.error_message = where.string() + ": " + detail;
    return result;
}

} // namespace

PathPredicate has_extension(std::vector<std::string> extensions) {
    return [extensions = std::move(extensions)](const fs::path& path) {
        const std::string ext = path.extension().string();
        return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
    };
}

DiscoveryResult discover(
    const fs::path& root,
    const PathPredicate& predicate,
    const std::function<SourceGroup(const fs::path&)>& classify
) {
    DiscoveryResult result;
    std::error_code ec;

    if (!fs::exists(root, ec)) {
        if (ec) {
            return failure(classify_error(ec), root, ec.message());
        }
        result.root_exists = false;
        return result;
    }

    if (!fs::is_directory(root, ec)) {
        return failure(DiscoveryError::NOT_A_DIRECTORY, root, "not a directory");
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return failure(classify_error(ec), root, ec.message());
    }

    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }

        const fs::path& path = it->path();
        if (!predicate(path)) {
            continue;
        }

        SourceFile source = SourceFile::describe(path, classify(path), entry_ec);
        if (entry_ec) {
            return failure(classify_error(entry_ec), path, entry_ec.message());
        }
        result.sources.push_back(std::move(source));
    }

    if (ec) {
        return failure(classify_error(ec), root, ec.message());
    }

    // Canonical sort for reproducibility
    std::sort(result.sources.begin(), result.sources.end(),
              [](const SourceFile& a, const SourceFile& b) { return a.path < b.path; });

    return result;
}

DiscoveryResult discover_project_sources(const ProjectConfig& config) {
    const fs::path root = config.source_root();
    const std::vector<std::string>& app_dirs = config.executable_only_dirs;

    auto classify = [&root, &app_dirs](const fs::path& path) {
        fs::path relative = path.lexically_relative(root).parent_path();
        for (const auto& component : relative) {
            if (std::find(app_dirs.begin(), app_dirs.end(), component.string()) != app_dirs.end()) {
                return SourceGroup::APPLICATION;
            }
        }
        return SourceGroup::LIBRARY;
    };

    return discover(root, has_extension(config.source_extensions), classify);
}

DiscoveryResult discover_test_sources(const ProjectConfig& config) {
    return discover(config.test_root(), has_extension(config.source_extensions),
                    [](const fs::path&) { return SourceGroup::TEST; });
}

std::optional<ObjectCollision> find_object_collision(const std::vector<SourceFile>& sources) {
    std::unordered_map<std::string, const SourceFile*> seen;

    for (const auto& source : sources) {
        std::string object_name = source.stem() + ".o";
        auto [it, inserted] = seen.emplace(object_name, &source);
        if (!inserted) {
            return ObjectCollision{it->second->path, source.path, object_name};
        }
    }

    return std::nullopt;
}

const char* error_string(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::OK:               return "ok";
        case DiscoveryError::NOT_A_DIRECTORY:  return "not a directory";
        case DiscoveryError::ACCESS_DENIED:    return "access denied";
        case DiscoveryError::FILESYSTEM_ERROR: return "filesystem error";
        default:                               return "unknown error";
    }
}

} // namespace spectre::make::discovery
