#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"
#include "../msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <limits>
#include <string>
#include <vector>

namespace webbridge::ipc::actions {

namespace {

void pack_decision(msgpack::packer<msgpack::sbuffer>& pk, NavigationDecision decision) {
    pk.pack("payload");
    pk.pack_map(1);
    pk.pack("decision");
    pk.pack(std::string(to_string(decision)));
    pk.pack("error");
    pk.pack_nil();
}

} // namespace

class SurfaceCreateAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.create"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        if (!ensure_payload_map(ctx, pk)) {
            return;
        }

        std::string instance_id = extract_instance_id(ctx.payload);
        if (instance_id.empty()) {
            LOG4CPLUS_ERROR(ipc_logger(), "surface.create: instance_id is required");
            pack_error_response(pk, "instance_id is required");
            return;
        }
        auto parent_id = codec::as_optional_string(codec::find_key(ctx.payload, "parent_id"));
        if (parent_id && parent_id->empty()) {
            parent_id.reset();
        }

        if (ctx.context.get_instance(instance_id)) {
            pack_error_response(pk, "instance already exists");
            return;
        }
        if (parent_id && !ctx.context.get_instance(*parent_id)) {
            pack_error_response(pk, "parent instance not found");
            return;
        }

        auto inst = ctx.context.create_instance(instance_id, parent_id);
        if (!inst) {
            pack_error_response(pk, "failed to create instance");
            return;
        }

        pk.pack("payload");
        pk.pack_map(1);
        pk.pack("instance_id");
        pk.pack(inst->instance_id);
        pk.pack("error");
        pk.pack_nil();
    }
};

class SurfaceDestroyAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.destroy"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        if (!ctx.context.remove_instance(inst->instance_id)) {
            pack_error_response(pk, "instance not found");
            return;
        }
        pack_success_response(pk);
    }
};

class SurfaceListAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.list"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto ids = ctx.context.list_instances();

        pk.pack("payload");
        pk.pack_map(1);
        pk.pack("instances");
        pk.pack_array(ids.size());
        for (const auto& id : ids) {
            auto inst = ctx.context.get_instance(id);
            pk.pack_map(3);
            pk.pack("instance_id");
            pk.pack(id);
            pk.pack("parent_id");
            codec::pack_optional_string(pk, inst ? inst->parent_id : std::nullopt);
            pk.pack("created_at");
            pk.pack(inst ? inst->created_at : std::string());
        }
        pk.pack("error");
        pk.pack_nil();
    }
};

class SurfacePostMessageAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.post_message"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        std::string body;
        if (!require_string(ctx, "body", body, pk)) {
            return;
        }
        auto origin = codec::as_optional_string(codec::find_key(ctx.payload, "origin"));

        bool accepted = inst->session->receive_message(origin, body);

        pk.pack("payload");
        pk.pack_map(1);
        pk.pack("accepted");
        pk.pack(accepted);
        pk.pack("error");
        pk.pack_nil();
    }
};

class SurfaceNavigationPolicyAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.navigation_policy"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        std::string url;
        if (!require_string(ctx, "url", url, pk)) {
            return;
        }
        pack_decision(pk, inst->session->decide_navigation(url));
    }
};

class SurfaceNavigationResponseAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.navigation_response"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        auto status_obj = codec::find_key(ctx.payload, "status_code");
        if (!status_obj) {
            pack_error_response(pk, "status_code is required");
            return;
        }
        auto status_code = codec::as_int64(*status_obj);
        if (!status_code || *status_code < std::numeric_limits<int>::min() ||
            *status_code > std::numeric_limits<int>::max()) {
            LOG4CPLUS_ERROR(ipc_logger(), "surface.navigation_response: status_code is not an int");
            pack_error_response(pk, "status_code must be an integer");
            return;
        }
        pack_decision(pk, inst->session->on_navigation_response(static_cast<int>(*status_code)));
    }
};

class SurfaceNavigationFailedAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.navigation_failed"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        std::string message;
        if (!require_string(ctx, "message", message, pk)) {
            return;
        }
        inst->session->on_navigation_failed(message);
        pack_success_response(pk);
    }
};

class SurfaceProgressAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.progress"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        auto progress_obj = codec::find_key(ctx.payload, "progress");
        if (!progress_obj) {
            pack_error_response(pk, "progress is required");
            return;
        }
        auto progress = codec::as_double(*progress_obj);
        if (!progress) {
            LOG4CPLUS_ERROR(ipc_logger(), "surface.progress: progress is not a number");
            pack_error_response(pk, "progress must be a number");
            return;
        }
        inst->session->on_progress(*progress);
        pack_success_response(pk);
    }
};

class SurfaceConsumeAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.consume"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        std::string what;
        if (!require_string(ctx, "what", what, pk)) {
            return;
        }

        if (what == "error") {
            inst->session->acknowledge_error();
        } else if (what == "navigation") {
            inst->session->consume_navigation();
        } else if (what == "notification") {
            inst->session->consume_notification();
        } else {
            LOG4CPLUS_ERROR(ipc_logger(), "surface.consume: unknown target " << what);
            pack_error_response(pk, "unknown consume target: " + what);
            return;
        }
        pack_success_response(pk);
    }
};

class SurfaceStateAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.state"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        ProtocolState state = inst->session->state();

        pk.pack("payload");
        pk.pack_map(4);
        pk.pack("load_progress");
        pk.pack(state.load_progress);
        pk.pack("pending_error");
        codec::pack_optional_string(pk, state.pending_error);
        pk.pack("pending_navigation_target");
        codec::pack_optional_string(pk, state.pending_navigation_target);
        pk.pack("pending_notification");
        codec::pack_optional_string(pk, state.pending_notification);
        pk.pack("error");
        pk.pack_nil();
    }
};

class SurfaceDrainScriptsAction final : public ActionHandler {
public:
    const char* name() const override { return "surface.drain_scripts"; }

    void handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
        auto inst = require_instance(ctx, pk);
        if (!inst) {
            return;
        }
        inst->session->flush();
        std::vector<std::string> scripts = inst->outbox->drain();

        pk.pack("payload");
        pk.pack_map(1);
        pk.pack("scripts");
        pk.pack(scripts);
        pk.pack("error");
        pk.pack_nil();
    }
};

void register_surface_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<SurfaceCreateAction>());
    registry.add(std::make_unique<SurfaceDestroyAction>());
    registry.add(std::make_unique<SurfaceListAction>());
    registry.add(std::make_unique<SurfacePostMessageAction>());
    registry.add(std::make_unique<SurfaceNavigationPolicyAction>());
    registry.add(std::make_unique<SurfaceNavigationResponseAction>());
    registry.add(std::make_unique<SurfaceNavigationFailedAction>());
    registry.add(std::make_unique<SurfaceProgressAction>());
    registry.add(std::make_unique<SurfaceConsumeAction>());
    registry.add(std::make_unique<SurfaceStateAction>());
    registry.add(std::make_unique<SurfaceDrainScriptsAction>());
}

} // namespace webbridge::ipc::actions
