#pragma once

#include "../host_context.hpp"

#include <msgpack.hpp>

#include <memory>
#include <string>

namespace webbridge::ipc::actions {

struct ActionContext {
	const std::string& action;
	HostContext& context;
	const msgpack::object& payload;
	bool has_payload;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;
	virtual void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) = 0;

protected:
	bool ensure_payload_map(const ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk);
	void pack_error_response(msgpack::packer<msgpack::sbuffer>& pk, const std::string& error_msg);
	void pack_success_response(msgpack::packer<msgpack::sbuffer>& pk);
	bool require_string(const ActionContext& ctx,
	                    const char* key,
	                    std::string& out,
	                    msgpack::packer<msgpack::sbuffer>& pk);
	std::shared_ptr<SurfaceInstance> require_instance(const ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk);
	std::string extract_instance_id(const msgpack::object& payload);
};

} // namespace webbridge::ipc::actions
