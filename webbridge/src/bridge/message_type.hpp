#pragma once

#include <optional>
#include <string_view>

namespace webbridge {

// Closed set of request types understood by the bridge. Wire names are camelCase.
enum class MessageType {
    greeting,
    get_user_info,
    get_app_version,
    open_url,
    show_toast,
};

std::optional<MessageType> message_type_from_string(std::string_view name);
const char* to_string(MessageType type);

} // namespace webbridge
