#pragma once

#include "message_type.hpp"
#include "payloads.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace webbridge {

enum class EnvelopeErrorKind {
    malformed_json,
    not_an_object,
    missing_type,
    unknown_type,
    invalid_field,
};

const char* to_string(EnvelopeErrorKind kind);

/**
 * Thrown when an inbound envelope cannot be decoded.
 * callback() holds the caller's callback name when it could still be read
 * from the raw object, so the failure reply can be addressed.
 */
class EnvelopeError : public std::runtime_error {
public:
    EnvelopeError(EnvelopeErrorKind kind, const std::string& message, std::optional<std::string> callback);

    EnvelopeErrorKind kind() const { return kind_; }
    const std::optional<std::string>& callback() const { return callback_; }

private:
    EnvelopeErrorKind kind_;
    std::optional<std::string> callback_;
};

/**
 * Decoded inbound envelope: { "type", "callback"?, "data"? }.
 * The payload stays untyped until a handler asks for a concrete shape.
 */
struct Request {
    MessageType type = MessageType::greeting;
    std::optional<std::string> callback;
    std::optional<nlohmann::json> payload;
};

Request decode_request(const nlohmann::json& raw);
Request decode_request(std::string_view raw_text);

// Reads "callback" from an object even when the rest of the envelope is unusable.
std::optional<std::string> extract_callback(const nlohmann::json& raw);

template <typename T>
std::optional<T> decode_payload(const Request& request) {
    if (!request.payload) {
        return std::nullopt;
    }
    try {
        return request.payload->get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

/**
 * Outbound envelope: { "success", "message", "data"? }.
 * data is never encoded when success is false.
 */
template <typename T = EmptyData>
struct Response {
    bool success = false;
    std::string message;
    std::optional<T> data;
};

template <typename T>
Response<T> success_response(std::string message, T data) {
    return Response<T>{true, std::move(message), std::move(data)};
}

inline Response<EmptyData> success_response(std::string message) {
    return Response<EmptyData>{true, std::move(message), std::nullopt};
}

inline Response<EmptyData> failure_response(std::string message) {
    return Response<EmptyData>{false, std::move(message), std::nullopt};
}

template <typename T>
nlohmann::json response_to_json(const Response<T>& response) {
    nlohmann::json j = nlohmann::json::object();
    j["success"] = response.success;
    j["message"] = response.message;
    if (response.success && response.data) {
        j["data"] = *response.data;
    }
    return j;
}

// Compact JSON with keys in sorted order.
std::string dump_sorted(const nlohmann::json& value);

template <typename T>
std::string encode_response(const Response<T>& response) {
    return dump_sorted(response_to_json(response));
}

} // namespace webbridge
