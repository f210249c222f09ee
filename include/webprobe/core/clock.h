#pragma once

#include <functional>

namespace webprobe::core {

// Seconds on a monotonic clock. Monitors take one so tests can drive time.
using TimeSource = std::function<double()>;

double monotonic_seconds();

// Returns `source` if set, otherwise monotonic_seconds.
TimeSource or_default_clock(TimeSource source);

}  // namespace webprobe::core
