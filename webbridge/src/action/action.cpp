#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

namespace webbridge::ipc::actions {

namespace {

const ActionRegistry& get_registry() {
	static const ActionRegistry registry = [] {
		ActionRegistry reg;
		register_surface_actions(reg);
		return reg;
	}();

	return registry;
}

} // namespace

bool ActionHandler::ensure_payload_map(const ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) {
	if (!ctx.has_payload || ctx.payload.type != msgpack::type::MAP) {
		LOG4CPLUS_ERROR(ipc_logger(), ctx.action << " missing payload");
		pack_error_response(pk, "Missing payload");
		return false;
	}
	return true;
}

void ActionHandler::pack_error_response(msgpack::packer<msgpack::sbuffer>& pk, const std::string& error_msg) {
	pk.pack("payload");
	pk.pack_map(0);
	pk.pack("error");
	codec::pack_error(pk, error_msg);
}

void ActionHandler::pack_success_response(msgpack::packer<msgpack::sbuffer>& pk) {
	pk.pack("payload");
	pk.pack_map(1);
	pk.pack("success");
	pk.pack(true);
	pk.pack("error");
	pk.pack_nil();
}

bool ActionHandler::require_string(const ActionContext& ctx,
                                   const char* key,
                                   std::string& out,
                                   msgpack::packer<msgpack::sbuffer>& pk) {
	auto obj = codec::find_key(ctx.payload, key);
	if (!obj || (obj->type != msgpack::type::STR && obj->type != msgpack::type::BIN)) {
		LOG4CPLUS_ERROR(ipc_logger(), ctx.action << ": " << key << " is required");
		pack_error_response(pk, std::string(key) + " is required");
		return false;
	}
	out = codec::as_string(*obj);
	return true;
}

std::shared_ptr<SurfaceInstance> ActionHandler::require_instance(const ActionContext& ctx,
                                                                 msgpack::packer<msgpack::sbuffer>& pk) {
	if (!ensure_payload_map(ctx, pk)) {
		return nullptr;
	}
	std::string instance_id = extract_instance_id(ctx.payload);
	if (instance_id.empty()) {
		LOG4CPLUS_ERROR(ipc_logger(), ctx.action << ": instance_id is required");
		pack_error_response(pk, "instance_id is required");
		return nullptr;
	}
	auto inst = ctx.context.get_instance(instance_id);
	if (!inst) {
		LOG4CPLUS_ERROR(ipc_logger(), ctx.action << ": instance not found: " << instance_id);
		pack_error_response(pk, "instance not found");
		return nullptr;
	}
	return inst;
}

std::string ActionHandler::extract_instance_id(const msgpack::object& payload) {
	if (auto id_obj = codec::find_key(payload, "instance_id")) {
		return codec::as_string(*id_obj, "");
	}
	return "";
}

std::string handle_action(const std::string& request_bytes, HostContext& context) {
	msgpack::sbuffer buffer;
	msgpack::packer<msgpack::sbuffer> pk(&buffer);

	codec::Request request;
	try {
		request = codec::decode_request(request_bytes);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(ipc_logger(), "Decode error: " << exc.what());
		return codec::encode_error_response("", std::string("Decode error: ") + exc.what());
	}

	LOG4CPLUS_DEBUG(ipc_logger(), "IPC action: " << request.action << " id=" << request.id);

	ActionHandler* handler = get_registry().find(request.action);
	if (!handler) {
		LOG4CPLUS_WARN(ipc_logger(), "Unknown action: " << request.action);
		return codec::encode_error_response(request.id, "Unknown action");
	}

	codec::pack_response_header(pk, request.id);

	ActionContext ctx{request.action, context, request.payload, request.has_payload};
	handler->handle(ctx, pk);

	return std::string(buffer.data(), buffer.size());
}

} // namespace webbridge::ipc::actions
