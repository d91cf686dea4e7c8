#pragma once

#include "bridge/security_config.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace webbridge {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HostConfig {
    SecurityConfig security = SecurityConfig::defaults();
    std::optional<std::string> user_name;
    std::string app_version;
    std::string socket_path = "/tmp/webbridge_host.sock";
    std::vector<std::string> external_schemes = {"tel", "mailto", "sms"};
};

/**
 * Load host configuration from a JSON file. Missing keys keep their
 * defaults. Throws ConfigError if the file cannot be read or parsed, or a
 * key has the wrong type.
 */
HostConfig load_host_config(const std::string& path, const std::string& default_app_version);

HostConfig parse_host_config(const std::string& json_text, const std::string& default_app_version);

} // namespace webbridge
