#include "security_config.hpp"

#include "url.hpp"

namespace webbridge {

SecurityConfig SecurityConfig::defaults() {
    SecurityConfig config;
    config.navigation_whitelist = {"apple.com", "google.com"};
    config.trusted_bridge_origins = {"file://", "myservice.com"};
    config.allow_local_scheme = true;
    return config;
}

void SecurityConfig::normalize() {
    local_scheme = to_lower_ascii(local_scheme);
    for (auto& entry : navigation_whitelist) {
        entry = to_lower_ascii(entry);
    }
    for (auto& entry : trusted_bridge_origins) {
        entry = to_lower_ascii(entry);
    }
}

} // namespace webbridge
