#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace webbridge {

// Request payloads, resolved lazily from Request::payload.

struct GreetingRequestData {
    std::string text;
    std::optional<std::string> timestamp;
};

struct OpenUrlRequestData {
    std::string url;
};

struct ShowToastRequestData {
    std::string message;
};

void from_json(const nlohmann::json& j, GreetingRequestData& data);
void from_json(const nlohmann::json& j, OpenUrlRequestData& data);
void from_json(const nlohmann::json& j, ShowToastRequestData& data);

// Response payloads.

struct EmptyData {};

struct GreetingResponseData {
    std::string text;
};

struct UserInfoResponseData {
    std::string name;
    std::string device;
    std::string os_version;
};

struct AppVersionResponseData {
    std::string app_version;
    std::string os_version;
    std::string device;
};

void to_json(nlohmann::json& j, const EmptyData& data);
void to_json(nlohmann::json& j, const GreetingResponseData& data);
void to_json(nlohmann::json& j, const UserInfoResponseData& data);
void to_json(nlohmann::json& j, const AppVersionResponseData& data);

} // namespace webbridge
