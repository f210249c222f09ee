#pragma once

#include <string>
#include <string_view>

namespace webprobe::core {

// Cuts `text` to at most `limit` bytes (backing off to a UTF-8 boundary)
// and appends "..." when anything was removed.
std::string preview_text(std::string_view text, std::size_t limit);

std::string to_lower_ascii(std::string value);

}  // namespace webprobe::core
