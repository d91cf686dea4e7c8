#include "message_type.hpp"

#include <array>

namespace webbridge {

namespace {

constexpr std::array<MessageType, 5> kAllTypes = {
    MessageType::greeting,
    MessageType::get_user_info,
    MessageType::get_app_version,
    MessageType::open_url,
    MessageType::show_toast,
};

} // namespace

const char* to_string(MessageType type) {
    switch (type) {
    case MessageType::greeting:
        return "greeting";
    case MessageType::get_user_info:
        return "getUserInfo";
    case MessageType::get_app_version:
        return "getAppVersion";
    case MessageType::open_url:
        return "openUrl";
    case MessageType::show_toast:
        return "showToast";
    }
    return "";
}

std::optional<MessageType> message_type_from_string(std::string_view name) {
    for (auto type : kAllTypes) {
        if (name == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace webbridge
