#pragma once

#include <optional>
#include <string>

namespace webbridge {

/**
 * Per-surface state owned by the reducer.
 * Each pending_* field is set by a producer and cleared only by its
 * consumption action.
 */
struct ProtocolState {
    double load_progress = 0.0;  // [0, 1]
    std::optional<std::string> pending_error;
    std::optional<std::string> pending_navigation_target;
    std::optional<std::string> pending_notification;

    bool operator==(const ProtocolState& other) const {
        return load_progress == other.load_progress && pending_error == other.pending_error &&
               pending_navigation_target == other.pending_navigation_target &&
               pending_notification == other.pending_notification;
    }
    bool operator!=(const ProtocolState& other) const { return !(*this == other); }
};

} // namespace webbridge
