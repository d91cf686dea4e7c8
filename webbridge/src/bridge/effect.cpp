#include "effect.hpp"

#include "dispatch.hpp"

#include <utility>

namespace webbridge {

Effect Effect::reply(std::optional<std::string> callback, Renderer render) {
    Effect effect;
    effect.callback_ = std::move(callback);
    effect.render_ = std::move(render);
    return effect;
}

std::string Effect::render() const {
    if (!render_) {
        return {};
    }
    return render_();
}

void Effect::run(const ReplyDispatcher& dispatcher) const {
    if (is_none() || !callback_) {
        return;
    }
    dispatcher.send(callback_, render());
}

} // namespace webbridge
