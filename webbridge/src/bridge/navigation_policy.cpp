#include "navigation_policy.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace webbridge {

const char* to_string(NavigationDecision decision) {
    switch (decision) {
    case NavigationDecision::allow:
        return "allow";
    case NavigationDecision::cancel:
        return "cancel";
    case NavigationDecision::open_externally:
        return "open_externally";
    }
    return "cancel";
}

NavigationPolicy::NavigationPolicy(const SecurityGate& gate, const std::vector<std::string>& external_schemes)
    : gate_(gate), external_schemes_(external_schemes) {}

NavigationVerdict NavigationPolicy::decide(const std::optional<Url>& url) const {
    if (!url) {
        return {NavigationDecision::cancel, std::nullopt};
    }

    const auto& config = gate_.config();
    if (url->scheme == config.local_scheme) {
        return {config.allow_local_scheme ? NavigationDecision::allow : NavigationDecision::cancel, std::nullopt};
    }

    if (url->scheme == "http" || url->scheme == "https") {
        if (gate_.is_navigation_allowed(url->host)) {
            return {NavigationDecision::allow, std::nullopt};
        }
        const std::string host = url->host.value_or("");
        LOG4CPLUS_WARN(security_logger(), "Blocked navigation to host: " << (host.empty() ? "unknown" : host));
        return {NavigationDecision::cancel, "Domain is not allowed: " + host};
    }

    if (std::find(external_schemes_.begin(), external_schemes_.end(), url->scheme) != external_schemes_.end()) {
        return {NavigationDecision::open_externally, std::nullopt};
    }

    return {NavigationDecision::cancel, std::nullopt};
}

NavigationVerdict NavigationPolicy::decide_response(int status_code) const {
    if (status_code >= 400) {
        return {NavigationDecision::cancel, "HTTP " + std::to_string(status_code) + " error occurred."};
    }
    return {NavigationDecision::allow, std::nullopt};
}

} // namespace webbridge
