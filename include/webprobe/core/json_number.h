#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace webprobe::core {

// Integer view of a JSON number. Floats are truncated toward zero; values
// that are not numbers, not finite, or outside the target range are absent.
std::optional<std::int64_t> json_to_int64(const nlohmann::json& value);
std::optional<int> json_to_int(const nlohmann::json& value);

}  // namespace webprobe::core
