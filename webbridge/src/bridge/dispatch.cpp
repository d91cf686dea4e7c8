#include "dispatch.hpp"

#include "callback_name.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <utility>

namespace webbridge {

std::string make_script(const std::string& callback, const std::string& json) {
    std::string script;
    script.reserve(callback.size() + json.size() + 3);
    script.append(callback);
    script.push_back('(');
    script.append(json);
    script.append(");");
    return script;
}

ScriptEvaluatorSink::ScriptEvaluatorSink(Evaluator evaluator) : evaluator_(std::move(evaluator)) {}

void ScriptEvaluatorSink::deliver(const std::string& callback, const std::string& json) {
    if (!evaluator_) {
        LOG4CPLUS_WARN(bridge_logger(), "No script evaluator attached, reply to " << callback << " dropped");
        return;
    }
    if (!evaluator_(make_script(callback, json))) {
        LOG4CPLUS_WARN(bridge_logger(), "Script evaluation failed for callback " << callback);
    }
}

ReplyDispatcher::ReplyDispatcher(std::shared_ptr<DispatchSink> sink) : sink_(std::move(sink)) {}

void ReplyDispatcher::send(const std::optional<std::string>& callback, const std::string& json) const {
    if (!callback) {
        return;
    }
    if (!is_valid_callback_name(*callback)) {
        LOG4CPLUS_WARN(security_logger(), "Rejected callback name, reply dropped (length=" << callback->size() << ")");
        return;
    }
    if (!sink_) {
        return;
    }
    LOG4CPLUS_DEBUG(bridge_logger(), "Dispatch to " << *callback << " bytes=" << json.size());
    sink_->deliver(*callback, json);
}

} // namespace webbridge
