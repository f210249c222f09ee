#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace webprobe::perf {

struct MemoryUsage {
    std::optional<std::int64_t> used_js_heap_size;
    std::optional<std::int64_t> total_js_heap_size;
    std::optional<std::int64_t> js_heap_size_limit;

    // used / limit * 100; absent unless both are known and limit > 0.
    std::optional<double> usage_percentage() const;
};

// One page timing snapshot. Every metric is optional: absent means the
// browser could not measure it, which is different from a measured zero.
struct PerformanceMetrics {
    double timestamp = 0.0;
    std::optional<double> page_load_time;
    std::optional<double> dom_content_loaded;
    std::optional<double> first_paint;
    std::optional<double> first_contentful_paint;
    std::optional<double> largest_contentful_paint;
    std::optional<double> cumulative_layout_shift;
    std::optional<MemoryUsage> memory_usage;
    std::optional<std::int64_t> resource_count;

    bool has_any_metric() const;
};

// Maps the camelCase snapshot payload (pageLoadTime, domContentLoaded,
// firstPaint, firstContentfulPaint, largestContentfulPaint,
// cumulativeLayoutShift, memoryUsage{usedJSHeapSize, totalJSHeapSize,
// jsHeapSizeLimit}, resourceCount). Missing, null or non-numeric fields
// stay absent; a non-object payload yields an all-absent record.
PerformanceMetrics parse_performance_snapshot(const nlohmann::json& payload, double timestamp);

void to_json(nlohmann::json& j, const MemoryUsage& memory);
void to_json(nlohmann::json& j, const PerformanceMetrics& metrics);

}  // namespace webprobe::perf
