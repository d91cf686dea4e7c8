#include "envelope.hpp"

namespace webbridge {

const char* to_string(EnvelopeErrorKind kind) {
    switch (kind) {
    case EnvelopeErrorKind::malformed_json:
        return "malformed_json";
    case EnvelopeErrorKind::not_an_object:
        return "not_an_object";
    case EnvelopeErrorKind::missing_type:
        return "missing_type";
    case EnvelopeErrorKind::unknown_type:
        return "unknown_type";
    case EnvelopeErrorKind::invalid_field:
        return "invalid_field";
    }
    return "unknown";
}

EnvelopeError::EnvelopeError(EnvelopeErrorKind kind, const std::string& message, std::optional<std::string> callback)
    : std::runtime_error(message), kind_(kind), callback_(std::move(callback)) {}

std::optional<std::string> extract_callback(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    auto it = raw.find("callback");
    if (it == raw.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

Request decode_request(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw EnvelopeError(EnvelopeErrorKind::not_an_object, "envelope is not a JSON object", std::nullopt);
    }

    auto callback = extract_callback(raw);

    auto type_it = raw.find("type");
    if (type_it == raw.end() || type_it->is_null()) {
        throw EnvelopeError(EnvelopeErrorKind::missing_type, "envelope has no type", callback);
    }
    if (!type_it->is_string()) {
        throw EnvelopeError(EnvelopeErrorKind::invalid_field, "type is not a string", callback);
    }
    auto type = message_type_from_string(type_it->get_ref<const std::string&>());
    if (!type) {
        throw EnvelopeError(EnvelopeErrorKind::unknown_type,
                            "unknown type: " + type_it->get_ref<const std::string&>(), callback);
    }

    auto callback_it = raw.find("callback");
    if (callback_it != raw.end() && !callback_it->is_null() && !callback_it->is_string()) {
        throw EnvelopeError(EnvelopeErrorKind::invalid_field, "callback is not a string", std::nullopt);
    }

    Request request;
    request.type = *type;
    request.callback = std::move(callback);
    auto data_it = raw.find("data");
    if (data_it != raw.end() && !data_it->is_null()) {
        request.payload = *data_it;
    }
    return request;
}

Request decode_request(std::string_view raw_text) {
    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(raw_text.begin(), raw_text.end());
    } catch (const nlohmann::json::parse_error& exc) {
        throw EnvelopeError(EnvelopeErrorKind::malformed_json, exc.what(), std::nullopt);
    }
    return decode_request(raw);
}

std::string dump_sorted(const nlohmann::json& value) {
    // nlohmann::json stores objects in std::map, so keys come out sorted.
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace webbridge
