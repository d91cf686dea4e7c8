#include "reducer.hpp"

#include "logger.hpp"
#include "url.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace webbridge {

namespace {

template <typename T>
Effect reply_with(const std::optional<std::string>& callback, Response<T> response) {
    return Effect::reply(callback, [response = std::move(response)] { return encode_response(response); });
}

double clamp_progress(double progress) {
    if (std::isnan(progress)) {
        return 0.0;
    }
    return std::clamp(progress, 0.0, 1.0);
}

} // namespace

struct Reducer::Visitor {
    const Reducer& reducer;
    ProtocolState& state;

    Effect operator()(const ProgressUpdated& action) const {
        state.load_progress = clamp_progress(action.progress);
        return Effect::none();
    }

    Effect operator()(const ErrorOccurred& action) const {
        state.load_progress = 0.0;
        state.pending_error = action.message;
        return Effect::none();
    }

    Effect operator()(const BridgeMessageReceived& action) const {
        return reducer.handle_request(state, action.request);
    }

    Effect operator()(const ErrorAcknowledged&) const {
        state.pending_error.reset();
        return Effect::none();
    }

    Effect operator()(const NavigationConsumed&) const {
        state.pending_navigation_target.reset();
        return Effect::none();
    }

    Effect operator()(const NotificationConsumed&) const {
        state.pending_notification.reset();
        return Effect::none();
    }
};

Reducer::Reducer(std::shared_ptr<const HostEnvironment> environment) : environment_(std::move(environment)) {}

Effect Reducer::reduce(ProtocolState& state, const Action& action) const {
    return std::visit(Visitor{*this, state}, action);
}

Effect Reducer::handle_request(ProtocolState& state, const Request& request) const {
    LOG4CPLUS_DEBUG(bridge_logger(), "Bridge request: " << to_string(request.type));

    switch (request.type) {
    case MessageType::greeting:
        return handle_greeting(request);
    case MessageType::get_user_info:
        return handle_get_user_info(request);
    case MessageType::get_app_version:
        return handle_get_app_version(request);
    case MessageType::open_url:
        return handle_open_url(state, request);
    case MessageType::show_toast:
        return handle_show_toast(state, request);
    }
    return Effect::none();
}

Effect Reducer::handle_greeting(const Request& request) const {
    auto data = decode_payload<GreetingRequestData>(request);
    if (!data) {
        LOG4CPLUS_INFO(bridge_logger(), "greeting: payload has no text");
        return reply_with(request.callback, failure_response(messages::kGreetingFailed));
    }
    return reply_with(request.callback,
                      success_response(messages::kGreetingReceived, GreetingResponseData{data->text}));
}

Effect Reducer::handle_get_user_info(const Request& request) const {
    auto environment = environment_;
    return Effect::reply(request.callback, [environment] {
        UserInfoResponseData data;
        if (environment) {
            data.name = environment->user_name();
            data.device = environment->device_model();
            data.os_version = environment->os_version();
        }
        return encode_response(success_response(messages::kUserInfoLoaded, std::move(data)));
    });
}

Effect Reducer::handle_get_app_version(const Request& request) const {
    auto environment = environment_;
    return Effect::reply(request.callback, [environment] {
        AppVersionResponseData data;
        if (environment) {
            data.app_version = environment->app_version();
            data.os_version = environment->os_version();
            data.device = environment->device_identifier();
        }
        return encode_response(success_response(messages::kAppVersionLoaded, std::move(data)));
    });
}

Effect Reducer::handle_open_url(ProtocolState& state, const Request& request) const {
    auto data = decode_payload<OpenUrlRequestData>(request);
    if (!data || !parse_url(data->url)) {
        LOG4CPLUS_INFO(bridge_logger(), "openUrl: invalid url");
        return reply_with(request.callback, failure_response(messages::kInvalidUrl));
    }
    state.pending_navigation_target = data->url;
    return reply_with(request.callback, success_response(messages::kOpeningUrl));
}

Effect Reducer::handle_show_toast(ProtocolState& state, const Request& request) const {
    auto data = decode_payload<ShowToastRequestData>(request);
    if (!data) {
        LOG4CPLUS_INFO(bridge_logger(), "showToast: payload has no message");
        return reply_with(request.callback, failure_response(messages::kNoToastMessage));
    }
    state.pending_notification = data->message;
    return reply_with(request.callback, success_response(messages::kShowingToast));
}

} // namespace webbridge
