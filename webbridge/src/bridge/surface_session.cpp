#include "surface_session.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <utility>

namespace webbridge {

SurfaceSession::SurfaceSession(std::string id,
                               std::shared_ptr<const HostConfig> config,
                               std::shared_ptr<const HostEnvironment> environment,
                               std::shared_ptr<DispatchSink> sink)
    : id_(std::move(id)),
      config_(std::move(config)),
      environment_(std::move(environment)),
      gate_(config_->security),
      navigation_(gate_, config_->external_schemes),
      reducer_(environment_),
      dispatcher_(std::move(sink)) {}

SurfaceSession::~SurfaceSession() {
    close();
}

void SurfaceSession::post_locked(Effect effect) {
    if (effect.is_none()) {
        return;
    }
    const ReplyDispatcher& dispatcher = dispatcher_;
    if (!executor_.post([effect = std::move(effect), &dispatcher] { effect.run(dispatcher); })) {
        LOG4CPLUS_DEBUG(bridge_logger(), "Surface " << id_ << " closed, reply dropped");
    }
}

void SurfaceSession::send(const Action& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    post_locked(reducer_.reduce(state_, action));
}

bool SurfaceSession::receive_message(const std::optional<std::string>& origin, std::string_view body) {
    std::optional<Url> origin_url;
    if (origin) {
        origin_url = parse_url(*origin);
    }
    if (!gate_.is_bridge_origin_trusted(origin_url)) {
        LOG4CPLUS_WARN(security_logger(), "Surface " << id_ << ": untrusted bridge origin dropped: "
                                                     << (origin ? *origin : std::string("unknown")));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Request request = decode_request(body);
        LOG4CPLUS_INFO(bridge_logger(), "Surface " << id_ << " <- " << to_string(request.type)
                                                   << " callback=" << request.callback.value_or("-"));
        post_locked(reducer_.reduce(state_, BridgeMessageReceived{std::move(request)}));
        return true;
    } catch (const EnvelopeError& exc) {
        LOG4CPLUS_WARN(bridge_logger(), "Surface " << id_ << ": envelope rejected (" << to_string(exc.kind())
                                                   << "): " << exc.what());
        auto failure = failure_response(messages::kCannotProcess);
        post_locked(Effect::reply(exc.callback(), [failure] { return encode_response(failure); }));
        return false;
    }
}

NavigationDecision SurfaceSession::decide_navigation(std::string_view url) {
    auto verdict = navigation_.decide(parse_url(url));
    if (verdict.error) {
        send(ErrorOccurred{*verdict.error});
    }
    return verdict.decision;
}

NavigationDecision SurfaceSession::on_navigation_response(int status_code) {
    auto verdict = navigation_.decide_response(status_code);
    if (verdict.error) {
        LOG4CPLUS_WARN(bridge_logger(), "Surface " << id_ << ": navigation response " << status_code);
        send(ErrorOccurred{*verdict.error});
    }
    return verdict.decision;
}

void SurfaceSession::on_navigation_failed(const std::string& message) {
    LOG4CPLUS_WARN(bridge_logger(), "Surface " << id_ << ": navigation failed: " << message);
    send(ErrorOccurred{message});
}

void SurfaceSession::on_progress(double progress) {
    send(ProgressUpdated{progress});
}

void SurfaceSession::acknowledge_error() {
    send(ErrorAcknowledged{});
}

void SurfaceSession::consume_navigation() {
    send(NavigationConsumed{});
}

void SurfaceSession::consume_notification() {
    send(NotificationConsumed{});
}

ProtocolState SurfaceSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SurfaceSession::flush() {
    executor_.flush();
}

void SurfaceSession::close() {
    executor_.stop();
}

std::unique_ptr<SurfaceSession> SurfaceSession::open_child(std::string id, std::shared_ptr<DispatchSink> sink) const {
    return std::make_unique<SurfaceSession>(std::move(id), config_, environment_, std::move(sink));
}

} // namespace webbridge
