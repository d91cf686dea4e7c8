#pragma once

#include "envelope.hpp"

#include <string>
#include <variant>

namespace webbridge {

struct ProgressUpdated {
    double progress = 0.0;
};

// Navigation or transport failure, including a blocked navigation.
struct ErrorOccurred {
    std::string message;
};

struct BridgeMessageReceived {
    Request request;
};

struct ErrorAcknowledged {};
struct NavigationConsumed {};
struct NotificationConsumed {};

using Action = std::variant<
    ProgressUpdated,
    ErrorOccurred,
    BridgeMessageReceived,
    ErrorAcknowledged,
    NavigationConsumed,
    NotificationConsumed>;

} // namespace webbridge
