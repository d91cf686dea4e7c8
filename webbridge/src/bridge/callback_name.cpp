#include "callback_name.hpp"

namespace webbridge {

namespace {

bool is_ascii_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

bool is_head_char(char c) noexcept {
    return is_ascii_alpha(c) || c == '_' || c == '$';
}

bool is_tail_char(char c) noexcept {
    return is_head_char(c) || is_ascii_digit(c) || c == '.';
}

} // namespace

bool is_valid_callback_name(std::string_view name) noexcept {
    if (name.empty() || !is_head_char(name.front())) {
        return false;
    }
    for (auto it = name.begin() + 1; it != name.end(); ++it) {
        if (!is_tail_char(*it)) {
            return false;
        }
    }
    return true;
}

} // namespace webbridge
