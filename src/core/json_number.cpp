#include <webprobe/core/json_number.h>

#include <cmath>
#include <limits>

namespace webprobe::core {

std::optional<std::int64_t> json_to_int64(const nlohmann::json& value) {
    using Limits = std::numeric_limits<std::int64_t>;

    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(Limits::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        const double raw = std::trunc(value.get<double>());
        // 2^63 is exact as a double; the max itself is not.
        if (!std::isfinite(raw) || raw < static_cast<double>(Limits::min()) ||
            raw >= -static_cast<double>(Limits::min())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    return std::nullopt;
}

std::optional<int> json_to_int(const nlohmann::json& value) {
    auto wide = json_to_int64(value);
    if (!wide || *wide < std::numeric_limits<int>::min() ||
        *wide > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*wide);
}

}  // namespace webprobe::core
