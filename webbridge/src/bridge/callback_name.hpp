#pragma once

#include <string_view>

namespace webbridge {

/**
 * Grammar check for names interpolated into "name(json);".
 * First char [A-Za-z_$], following chars [A-Za-z0-9_$.], non-empty.
 */
bool is_valid_callback_name(std::string_view name) noexcept;

} // namespace webbridge
