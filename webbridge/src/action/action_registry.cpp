#include "action_registry.hpp"

namespace webbridge::ipc::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    handlers_.emplace(std::move(name), std::move(handler));
}

ActionHandler* ActionRegistry::find(const std::string& action) const {
    auto it = handlers_.find(action);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace webbridge::ipc::actions
