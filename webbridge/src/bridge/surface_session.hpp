#pragma once

#include "actions.hpp"
#include "dispatch.hpp"
#include "host_config.hpp"
#include "host_environment.hpp"
#include "navigation_policy.hpp"
#include "protocol_state.hpp"
#include "reducer.hpp"
#include "security_gate.hpp"
#include "serial_executor.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace webbridge {

/**
 * Bridge endpoint for one content surface.
 *
 * Owns the surface's ProtocolState and reducer. Actions are reduced one at
 * a time under the session mutex; the resulting effects run on the
 * session's own executor in the order the actions were reduced.
 */
class SurfaceSession {
public:
    SurfaceSession(std::string id,
                   std::shared_ptr<const HostConfig> config,
                   std::shared_ptr<const HostEnvironment> environment,
                   std::shared_ptr<DispatchSink> sink);
    ~SurfaceSession();

    SurfaceSession(const SurfaceSession&) = delete;
    SurfaceSession& operator=(const SurfaceSession&) = delete;

    const std::string& id() const { return id_; }

    void send(const Action& action);

    /**
     * Inbound message from the content surface.
     * origin is the URL of the calling frame. Returns false when the message
     * was dropped or could not be decoded; a decodable callback still gets
     * the generic failure reply in the latter case.
     */
    bool receive_message(const std::optional<std::string>& origin, std::string_view body);

    NavigationDecision decide_navigation(std::string_view url);
    NavigationDecision on_navigation_response(int status_code);
    void on_navigation_failed(const std::string& message);
    void on_progress(double progress);

    void acknowledge_error();
    void consume_navigation();
    void consume_notification();

    ProtocolState state() const;

    void flush();

    // Pending replies are dropped; later actions are still reduced but produce no delivery.
    void close();

    // Popup hand-off: fresh state, same configuration and environment.
    std::unique_ptr<SurfaceSession> open_child(std::string id, std::shared_ptr<DispatchSink> sink) const;

private:
    void post_locked(Effect effect);

    std::string id_;
    std::shared_ptr<const HostConfig> config_;
    std::shared_ptr<const HostEnvironment> environment_;
    SecurityGate gate_;
    NavigationPolicy navigation_;
    Reducer reducer_;
    ReplyDispatcher dispatcher_;

    mutable std::mutex mutex_;
    ProtocolState state_;
    SerialExecutor executor_;
};

} // namespace webbridge
