#include "msgpack_codec.hpp"

#include <exception>
#include <limits>

namespace webbridge::ipc::codec {

Request decode_request(const std::string& bytes) {
    Request req;
    req.handle = msgpack::unpack(bytes.data(), bytes.size());
    msgpack::object root = req.handle.get();

    if (auto id_obj = find_key(root, "id")) {
        req.id = as_string(*id_obj, "");
    }
    if (auto action_obj = find_key(root, "action")) {
        req.action = as_string(*action_obj, "");
    }
    if (auto payload_ptr = find_key(root, "payload")) {
        req.payload = *payload_ptr;
        req.has_payload = payload_ptr->type != msgpack::type::NIL;
    }

    return req;
}

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key) {
    if (map_obj.type != msgpack::type::MAP) {
        return nullptr;
    }

    auto map = map_obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& k = map.ptr[i].key;
        if (k.type == msgpack::type::STR && key.compare(0, std::string::npos, k.via.str.ptr, k.via.str.size) == 0) {
            return &map.ptr[i].val;
        }
    }
    return nullptr;
}

std::string as_string(const msgpack::object& obj, const std::string& fallback) {
    if (obj.type == msgpack::type::STR) {
        return std::string(obj.via.str.ptr, obj.via.str.size);
    }
    if (obj.type == msgpack::type::BIN) {
        return std::string(obj.via.bin.ptr, obj.via.bin.size);
    }
    return fallback;
}

std::optional<std::string> as_optional_string(const msgpack::object* obj) {
    if (!obj || (obj->type != msgpack::type::STR && obj->type != msgpack::type::BIN)) {
        return std::nullopt;
    }
    return as_string(*obj);
}

std::optional<int64_t> as_int64(const msgpack::object& obj) {
    if (obj.type == msgpack::type::POSITIVE_INTEGER) {
        if (obj.via.u64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(obj.via.u64);
    }
    if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
        return obj.via.i64;
    }
    return std::nullopt;
}

std::optional<double> as_double(const msgpack::object& obj) {
    if (obj.type == msgpack::type::FLOAT32 || obj.type == msgpack::type::FLOAT64) {
        return obj.via.f64;
    }
    if (obj.type == msgpack::type::POSITIVE_INTEGER) {
        return static_cast<double>(obj.via.u64);
    }
    if (obj.type == msgpack::type::NEGATIVE_INTEGER) {
        return static_cast<double>(obj.via.i64);
    }
    return std::nullopt;
}

void pack_response_header(msgpack::packer<msgpack::sbuffer>& pk, const std::string& id) {
    pk.pack_map(4);
    pk.pack("id");
    pk.pack(id);
    pk.pack("type");
    pk.pack("response");
}

void pack_error(msgpack::packer<msgpack::sbuffer>& pk, const std::string& message) {
    pk.pack_map(1);
    pk.pack("message");
    pk.pack(message);
}

void pack_optional_string(msgpack::packer<msgpack::sbuffer>& pk, const std::optional<std::string>& value) {
    if (value) {
        pk.pack(*value);
    } else {
        pk.pack_nil();
    }
}

std::string peek_request_id(const std::string& bytes) {
    try {
        return decode_request(bytes).id;
    } catch (const std::exception&) {
        return "";
    }
}

std::string encode_error_response(const std::string& id, const std::string& message) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_response_header(pk, id);
    pk.pack("payload");
    pk.pack_map(0);
    pk.pack("error");
    pack_error(pk, message);
    return std::string(buffer.data(), buffer.size());
}

} // namespace webbridge::ipc::codec
