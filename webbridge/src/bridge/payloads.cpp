#include "payloads.hpp"

namespace webbridge {

namespace {

// Absent and null both decode to nullopt; any other non-string type is a shape error.
std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

void from_json(const nlohmann::json& j, GreetingRequestData& data) {
    j.at("text").get_to(data.text);
    data.timestamp = optional_string(j, "timestamp");
}

void from_json(const nlohmann::json& j, OpenUrlRequestData& data) {
    j.at("url").get_to(data.url);
}

void from_json(const nlohmann::json& j, ShowToastRequestData& data) {
    j.at("message").get_to(data.message);
}

void to_json(nlohmann::json& j, const EmptyData&) {
    j = nlohmann::json::object();
}

void to_json(nlohmann::json& j, const GreetingResponseData& data) {
    j = nlohmann::json{{"text", data.text}};
}

void to_json(nlohmann::json& j, const UserInfoResponseData& data) {
    j = nlohmann::json{
        {"name", data.name},
        {"device", data.device},
        {"osVersion", data.os_version},
    };
}

void to_json(nlohmann::json& j, const AppVersionResponseData& data) {
    j = nlohmann::json{
        {"appVersion", data.app_version},
        {"osVersion", data.os_version},
        {"device", data.device},
    };
}

} // namespace webbridge
