/**
 * build_profile.cpp
 * Built-in profile table and lookup
 */

#include "core/build_profile.hpp"

namespace spectre::make {

namespace {

BuildProfile make_profile(Profile id,
                          std::vector<std::string> compiler_flags,
                          std::vector<std::string> linker_flags) {
    BuildProfile profile;
    profile.id = id;
    profile.name = profile_name(id);
    profile.compiler_flags = std::move(compiler_flags);
    profile.linker_flags = std::move(linker_flags);
    return profile;
}

size_t index_of(Profile id) {
    return static_cast<size_t>(id);
}

} // namespace

const char* profile_name(Profile profile) {
    switch (profile) {
        case Profile::DEBUG:   return "debug";
        case Profile::RELEASE: return "release";
        case Profile::PROFILE: return "profile";
        default:               return "unknown";
    }
}

std::optional<Profile> parse_profile(const std::string& name) {
    if (name == "debug")   return Profile::DEBUG;
    if (name == "release") return Profile::RELEASE;
    if (name == "profile") return Profile::PROFILE;
    return std::nullopt;
}

ProfileRegistry ProfileRegistry::defaults() {
    ProfileRegistry registry;

    registry.profiles_[index_of(Profile::DEBUG)] = make_profile(
        Profile::DEBUG,
        {"-Wall", "-Wextra", "-g", "-O0", "-DDEBUG=1"},
        {"-lm", "-pthread"});

    registry.profiles_[index_of(Profile::RELEASE)] = make_profile(
        Profile::RELEASE,
        {"-Wall", "-Wextra", "-O3", "-DNDEBUG"},
        {"-lm", "-pthread", "-flto"});

    // gprof instrumentation must be present at both compile and link time
    registry.profiles_[index_of(Profile::PROFILE)] = make_profile(
        Profile::PROFILE,
        {"-Wall", "-Wextra", "-g", "-O2", "-pg"},
        {"-lm", "-pthread", "-pg"});

    return registry;
}

ProfileLookup ProfileRegistry::lookup(const std::string& name) const {
    ProfileLookup result;

    std::optional<Profile> id = parse_profile(name);
    if (!id) {
        std::string known;
        for (const auto& profile : profiles_) {
            if (!known.empty()) known += ", ";
            known += profile.name;
        }
        result.error = BuildError(ErrorKind::UNKNOWN_PROFILE, name,
                                  "unknown build configuration (expected one of: " + known + ")");
        return result;
    }

    result.profile = get(*id);
    return result;
}

const BuildProfile& ProfileRegistry::get(Profile id) const {
    return profiles_[index_of(id)];
}

BuildError ProfileRegistry::override_flags(
    const std::string& name,
    const std::optional<std::vector<std::string>>& compiler_flags,
    const std::optional<std::vector<std::string>>& linker_flags) {

    std::optional<Profile> id = parse_profile(name);
    if (!id) {
        return BuildError(ErrorKind::UNKNOWN_PROFILE, name,
                          "cannot override flags of an unregistered profile");
    }

    BuildProfile& profile = profiles_[index_of(*id)];
    if (compiler_flags) {
        profile.compiler_flags = *compiler_flags;
    }
    if (linker_flags) {
        profile.linker_flags = *linker_flags;
    }
    return BuildError{};
}

std::vector<std::string> ProfileRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        result.push_back(profile.name);
    }
    return result;
}

} // namespace spectre::make
