#pragma once

#include "actions.hpp"
#include "effect.hpp"
#include "host_environment.hpp"
#include "protocol_state.hpp"

#include <memory>

namespace webbridge {

namespace messages {

constexpr const char* kGreetingReceived = "Message received.";
constexpr const char* kGreetingFailed = "Failed to deliver the message.";
constexpr const char* kUserInfoLoaded = "User info loaded.";
constexpr const char* kAppVersionLoaded = "App version info loaded.";
constexpr const char* kOpeningUrl = "Opening the URL in a new screen.";
constexpr const char* kInvalidUrl = "Invalid URL.";
constexpr const char* kShowingToast = "Showing the toast.";
constexpr const char* kNoToastMessage = "No message to show.";
constexpr const char* kCannotProcess = "Cannot process the request.";

} // namespace messages

/**
 * Protocol state machine for one content surface.
 *
 * reduce() applies one action to the state in place and returns the
 * deferred effect, if any. It never calls the sink or the environment
 * itself; both are reached only when the returned effect runs.
 */
class Reducer {
public:
    explicit Reducer(std::shared_ptr<const HostEnvironment> environment);

    Effect reduce(ProtocolState& state, const Action& action) const;

private:
    struct Visitor;

    Effect handle_request(ProtocolState& state, const Request& request) const;
    Effect handle_greeting(const Request& request) const;
    Effect handle_get_user_info(const Request& request) const;
    Effect handle_get_app_version(const Request& request) const;
    Effect handle_open_url(ProtocolState& state, const Request& request) const;
    Effect handle_show_toast(ProtocolState& state, const Request& request) const;

    std::shared_ptr<const HostEnvironment> environment_;
};

} // namespace webbridge
