#pragma once

#include <string>
#include <vector>

namespace webbridge {

/**
 * Process-wide security configuration, loaded once at startup.
 * Host suffix entries are stored lowercased.
 */
struct SecurityConfig {
    std::vector<std::string> navigation_whitelist;
    std::vector<std::string> trusted_bridge_origins;
    bool allow_local_scheme = true;
    std::string local_scheme = "file";

    static SecurityConfig defaults();

    // Marker placed in trusted_bridge_origins to trust local content ("file://").
    std::string local_origin_marker() const { return local_scheme + "://"; }

    void normalize();
};

} // namespace webbridge
