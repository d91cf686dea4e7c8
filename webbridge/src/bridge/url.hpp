#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace webbridge {

/**
 * Parsed absolute URL.
 * scheme and host are lowercased; everything else is kept as written.
 */
struct Url {
    std::string scheme;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;
    std::string spec;  // input as given
};

/**
 * Parse an absolute URL. Returns nullopt for empty input, input containing
 * whitespace or control characters, a missing or malformed scheme, an empty
 * authority host (except for file URLs) or an invalid port.
 */
std::optional<Url> parse_url(std::string_view text);

std::string to_lower_ascii(std::string_view text);

} // namespace webbridge
