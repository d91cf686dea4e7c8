#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace webbridge {

/**
 * Delivers a reply into the content surface.
 * Implementations own delivery and its failures; nothing is reported back.
 */
class DispatchSink {
public:
    virtual ~DispatchSink() = default;
    virtual void deliver(const std::string& callback, const std::string& json) = 0;
};

// "<callback>(<json>);"
std::string make_script(const std::string& callback, const std::string& json);

/**
 * Sink over a script evaluator, e.g. a rendering surface's
 * "evaluate JavaScript" entry point. A false return is a delivery failure.
 */
class ScriptEvaluatorSink final : public DispatchSink {
public:
    using Evaluator = std::function<bool(const std::string& script)>;

    explicit ScriptEvaluatorSink(Evaluator evaluator);

    void deliver(const std::string& callback, const std::string& json) override;

private:
    Evaluator evaluator_;
};

/**
 * Last step before the sink: drops replies without a callback and replies
 * whose callback name fails the injection grammar.
 */
class ReplyDispatcher {
public:
    explicit ReplyDispatcher(std::shared_ptr<DispatchSink> sink);

    void send(const std::optional<std::string>& callback, const std::string& json) const;

private:
    std::shared_ptr<DispatchSink> sink_;
};

} // namespace webbridge
