#include "security_gate.hpp"

#include <algorithm>

namespace webbridge {

bool matches_host_suffix(std::string_view host, std::string_view entry) {
    if (entry.empty()) {
        return false;
    }
    if (host == entry) {
        return true;
    }
    if (host.size() <= entry.size()) {
        return false;
    }
    auto offset = host.size() - entry.size();
    return host[offset - 1] == '.' && host.substr(offset) == entry;
}

SecurityGate::SecurityGate(const SecurityConfig& config) : config_(config) {}

bool SecurityGate::host_in(const std::string& host, const std::vector<std::string>& entries) {
    const std::string lowered = to_lower_ascii(host);
    return std::any_of(entries.begin(), entries.end(), [&](const std::string& entry) {
        return matches_host_suffix(lowered, to_lower_ascii(entry));
    });
}

bool SecurityGate::is_navigation_allowed(const std::optional<std::string>& host) const {
    if (!host) {
        return false;
    }
    return host_in(*host, config_.navigation_whitelist);
}

bool SecurityGate::is_bridge_origin_trusted(const std::optional<Url>& origin) const {
    if (!origin) {
        return false;
    }
    if (origin->scheme == config_.local_scheme) {
        const auto marker = config_.local_origin_marker();
        return std::find(config_.trusted_bridge_origins.begin(), config_.trusted_bridge_origins.end(), marker) !=
               config_.trusted_bridge_origins.end();
    }
    if (!origin->host) {
        return false;
    }
    return host_in(*origin->host, config_.trusted_bridge_origins);
}

} // namespace webbridge
