#pragma once

#include "../host_context.hpp"

#include <string>

namespace webbridge::ipc::actions {

std::string handle_action(const std::string& request_bytes, HostContext& context);

} // namespace webbridge::ipc::actions
