#pragma once

#include <msgpack.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace webbridge::ipc::codec {

struct Request {
    std::string id;
    std::string action;
    msgpack::object payload;
    bool has_payload = false;
    msgpack::object_handle handle;
};

Request decode_request(const std::string& bytes);

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");
std::optional<std::string> as_optional_string(const msgpack::object* obj);
// nullopt unless obj is an integer that fits in int64_t.
std::optional<int64_t> as_int64(const msgpack::object& obj);
// nullopt unless obj is an integer or a float.
std::optional<double> as_double(const msgpack::object& obj);

void pack_response_header(msgpack::packer<msgpack::sbuffer>& pk, const std::string& id);
void pack_error(msgpack::packer<msgpack::sbuffer>& pk, const std::string& message);
void pack_optional_string(msgpack::packer<msgpack::sbuffer>& pk, const std::optional<std::string>& value);

// Best effort: the "id" of a request frame, empty if the frame does not decode.
std::string peek_request_id(const std::string& bytes);

// Complete response frame with an empty payload and error.message set.
std::string encode_error_response(const std::string& id, const std::string& message);

} // namespace webbridge::ipc::codec
