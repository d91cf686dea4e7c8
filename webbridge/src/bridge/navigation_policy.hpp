#pragma once

#include "security_gate.hpp"
#include "url.hpp"

#include <optional>
#include <string>
#include <vector>

namespace webbridge {

enum class NavigationDecision {
    allow,
    cancel,
    open_externally,
};

const char* to_string(NavigationDecision decision);

struct NavigationVerdict {
    NavigationDecision decision = NavigationDecision::cancel;
    std::optional<std::string> error;  // set when the surface must be told
};

class NavigationPolicy {
public:
    NavigationPolicy(const SecurityGate& gate, const std::vector<std::string>& external_schemes);

    NavigationVerdict decide(const std::optional<Url>& url) const;
    NavigationVerdict decide_response(int status_code) const;

private:
    const SecurityGate& gate_;
    const std::vector<std::string>& external_schemes_;
};

} // namespace webbridge
