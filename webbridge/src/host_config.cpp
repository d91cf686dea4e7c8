#include "host_config.hpp"

#include "bridge/url.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <log4cplus/loggingmacros.h>

#include <fstream>
#include <sstream>

namespace webbridge {

namespace {

template <typename T>
void read_key(const nlohmann::json& root, const char* key, T& out) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return;
    }
    try {
        it->get_to(out);
    } catch (const nlohmann::json::exception& exc) {
        throw ConfigError(std::string("config key '") + key + "': " + exc.what());
    }
}

} // namespace

HostConfig parse_host_config(const std::string& json_text, const std::string& default_app_version) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& exc) {
        throw ConfigError(std::string("config is not valid JSON: ") + exc.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    HostConfig config;
    config.app_version = default_app_version;

    read_key(root, "navigation_whitelist", config.security.navigation_whitelist);
    read_key(root, "trusted_bridge_origins", config.security.trusted_bridge_origins);
    read_key(root, "allow_local_scheme", config.security.allow_local_scheme);
    read_key(root, "local_scheme", config.security.local_scheme);
    read_key(root, "app_version", config.app_version);
    read_key(root, "socket_path", config.socket_path);
    read_key(root, "external_schemes", config.external_schemes);

    std::string user_name;
    read_key(root, "user_name", user_name);
    if (!user_name.empty()) {
        config.user_name = user_name;
    }

    config.security.normalize();
    for (auto& scheme : config.external_schemes) {
        scheme = to_lower_ascii(scheme);
    }
    return config;
}

HostConfig load_host_config(const std::string& path, const std::string& default_app_version) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    HostConfig config = parse_host_config(buffer.str(), default_app_version);
    LOG4CPLUS_INFO(core_logger(), "Loaded config " << path << ": " << config.security.navigation_whitelist.size()
                                                   << " navigation entries, "
                                                   << config.security.trusted_bridge_origins.size()
                                                   << " trusted origins");
    return config;
}

} // namespace webbridge
