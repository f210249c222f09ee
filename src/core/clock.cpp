#include <webprobe/core/clock.h>

#include <chrono>

namespace webprobe::core {

double monotonic_seconds() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

TimeSource or_default_clock(TimeSource source) {
    if (source) {
        return source;
    }
    return &monotonic_seconds;
}

}  // namespace webprobe::core
