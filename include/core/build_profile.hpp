/**
 * build_profile.hpp
 * Config Registry for spectre_make
 *
 * A build profile is a named set of compiler and linker flags defining one
 * build variant. The registry holds exactly the profiles named by the
 * Profile enum; it is populated once at startup (defaults, then optional
 * project file overrides) and read-only afterwards.
 */

#ifndef SPECTRE_MAKE_BUILD_PROFILE_HPP
#define SPECTRE_MAKE_BUILD_PROFILE_HPP

#include "core/build_error.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace spectre::make {

enum class Profile {
    DEBUG,
    RELEASE,
    PROFILE
};

const char* profile_name(Profile profile);

// Returns std::nullopt for names outside the enum
std::optional<Profile> parse_profile(const std::string& name);

struct BuildProfile {
    Profile id = Profile::DEBUG;
    std::string name;
    std::vector<std::string> compiler_flags;
    std::vector<std::string> linker_flags;
};

/**
 * Result of a registry lookup
 */
struct ProfileLookup {
    BuildProfile profile;
    BuildError error;

    bool ok() const { return error.ok(); }
};

class ProfileRegistry {
public:
    static constexpr size_t PROFILE_COUNT = 3;

    /**
     * Registry holding the built-in flag sets for debug, release and profile.
     */
    static ProfileRegistry defaults();

    /**
     * Look up a profile by name.
     * Fails with UNKNOWN_PROFILE if the name is not registered.
     */
    ProfileLookup lookup(const std::string& name) const;

    const BuildProfile& get(Profile id) const;

    /**
     * Replace the flag sets of a registered profile. Used while loading the
     * project file, before the registry is shared with any stage.
     * An unset optional leaves the corresponding flag set untouched.
     */
    BuildError override_flags(const std::string& name,
                              const std::optional<std::vector<std::string>>& compiler_flags,
                              const std::optional<std::vector<std::string>>& linker_flags);

    std::vector<std::string> names() const;

private:
    std::array<BuildProfile, PROFILE_COUNT> profiles_;
};

} // namespace spectre::make

#endif // SPECTRE_MAKE_BUILD_PROFILE_HPP
