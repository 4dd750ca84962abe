#ifndef REDLINE_CONFIG_HOST_REGISTRY_H
#define REDLINE_CONFIG_HOST_REGISTRY_H

#include "redline/config/host_profile.h"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace redline::config {

enum class ConfigError : std::uint32_t {
    Ok = 0,
    MalformedJson = 1,
    NotAnObject = 2,
    MissingField = 3,
    InvalidField = 4,
    UnknownBase = 5,
};

const char* toString(ConfigError error);

/**
 * HostRegistry: the per-host profile table.
 *
 * Starts with one profile per category plus tuned entries for known hosts.
 * External tables can override or extend it with loadFromJson():
 *
 *   {"hosts": [{"id": "slack", "extends": "electron",
 *               "bundleIds": ["com.tinyspeck.slackmacgap"],
 *               "strategies": ["elementTree", "textMarker"],
 *               "font": {"family": "Lato", "size": 15}}]}
 *
 * Fields that are absent keep the value of the base profile.
 */
class HostRegistry {
public:
    HostRegistry();

    /**
     * Profile for a bundle id, or the native default when nothing matches.
     */
    const HostProfile& profileFor(std::string_view bundleId) const;

    const HostProfile* findById(std::string_view id) const;

    /**
     * Add a profile, replacing any profile with the same id.
     */
    void registerProfile(HostProfile profile);

    /**
     * Merge a JSON host table. Nothing is applied unless the whole table parses.
     */
    ConfigError loadFromJson(std::string_view json);

    std::size_t size() const { return profiles_.size(); }

private:
    std::vector<HostProfile> profiles_;
};

} // namespace redline::config

#endif // REDLINE_CONFIG_HOST_REGISTRY_H
