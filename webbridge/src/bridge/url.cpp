#include "url.hpp"

#include <cctype>

namespace webbridge {

namespace {

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool has_forbidden_char(std::string_view text) {
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return true;
        }
        if (c == '<' || c == '>' || c == '"' || c == '\\' || c == '^' || c == '`' || c == '{' || c == '|' ||
            c == '}') {
            return true;
        }
    }
    return false;
}

bool parse_port(std::string_view text, uint16_t& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

// authority = [ userinfo "@" ] host [ ":" port ]
bool parse_authority(std::string_view authority, Url& url) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = authority.substr(0, close + 1);
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return false;
            }
            port = rest.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (!host.empty()) {
        url.host = to_lower_ascii(host);
    }
    if (!port.empty()) {
        uint16_t value = 0;
        if (!parse_port(port, value)) {
            return false;
        }
        url.port = value;
    }
    return true;
}

} // namespace

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<Url> parse_url(std::string_view text) {
    if (text.empty() || has_forbidden_char(text)) {
        return std::nullopt;
    }

    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    std::string_view scheme = text.substr(0, colon);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return std::nullopt;
    }
    for (char c : scheme) {
        if (!is_scheme_char(c)) {
            return std::nullopt;
        }
    }

    Url url;
    url.spec = std::string(text);
    url.scheme = to_lower_ascii(scheme);

    std::string_view rest = text.substr(colon + 1);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        url.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
        rest.remove_prefix(2);
        auto slash = rest.find('/');
        std::string_view authority = rest.substr(0, slash);
        if (!parse_authority(authority, url)) {
            return std::nullopt;
        }
        if (!url.host && url.scheme != "file") {
            return std::nullopt;
        }
        url.path = slash == std::string_view::npos ? std::string() : std::string(rest.substr(slash));
    } else {
        url.path = std::string(rest);
    }

    return url;
}

} // namespace webbridge
