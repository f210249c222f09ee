#ifndef WEBPROBE_CORE_CONFIG_H
#define WEBPROBE_CORE_CONFIG_H

#include <chrono>
#include <cstddef>

namespace webprobe::core::config {

inline constexpr std::size_t kDefaultEventLogCapacity = 1000;
inline constexpr std::size_t kDiagnosticRetention = 500;

// Export views
inline constexpr std::size_t kTimelineLimit = 20;
inline constexpr std::size_t kCriticalIssueLimit = 10;
inline constexpr std::size_t kCategoryMessageLimit = 10;
inline constexpr std::size_t kTextPreviewLength = 100;
inline constexpr std::size_t kRankedRequestCount = 5;

// Console rules only scan this many leading bytes of a message. std::regex
// recurses per character, so unbounded input can exhaust the stack.
inline constexpr std::size_t kClassifyTextLimit = 4096;

inline constexpr std::chrono::milliseconds kSnapshotTimeout{5000};

}  // namespace webprobe::core::config

#endif  // WEBPROBE_CORE_CONFIG_H
