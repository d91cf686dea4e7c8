#pragma once

#include <functional>
#include <optional>
#include <string>

namespace webbridge {

class ReplyDispatcher;

/**
 * Deferred work returned by the reducer: nothing, or one reply.
 * The reply body is rendered when the effect runs, so environment lookups
 * happen outside the transition.
 */
class Effect {
public:
    using Renderer = std::function<std::string()>;

    static Effect none() { return Effect(); }
    static Effect reply(std::optional<std::string> callback, Renderer render);

    bool is_none() const { return !render_; }
    const std::optional<std::string>& callback() const { return callback_; }

    // Encoded reply JSON; empty for Effect::none().
    std::string render() const;

    void run(const ReplyDispatcher& dispatcher) const;

private:
    std::optional<std::string> callback_;
    Renderer render_;
};

} // namespace webbridge
