#pragma once

#include "security_config.hpp"
#include "url.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webbridge {

// h == d or h ends with "." + d. Both sides must already be lowercased.
bool matches_host_suffix(std::string_view host, std::string_view entry);

/**
 * Origin and navigation predicates over an immutable SecurityConfig.
 * Holds no mutable state; safe to share between threads.
 */
class SecurityGate {
public:
    explicit SecurityGate(const SecurityConfig& config);

    bool is_navigation_allowed(const std::optional<std::string>& host) const;
    bool is_bridge_origin_trusted(const std::optional<Url>& origin) const;

    const SecurityConfig& config() const { return config_; }

private:
    static bool host_in(const std::string& host, const std::vector<std::string>& entries);

    const SecurityConfig& config_;
};

} // namespace webbridge
