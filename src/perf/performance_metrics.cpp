#include <webprobe/perf/performance_metrics.h>

#include <webprobe/core/json_number.h>

#include <string>

namespace webprobe::perf {
namespace {

std::optional<double> number_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<std::int64_t> integer_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    return core::json_to_int64(*it);
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::optional<double> MemoryUsage::usage_percentage() const {
    if (!used_js_heap_size || !js_heap_size_limit || *js_heap_size_limit <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(*used_js_heap_size) / static_cast<double>(*js_heap_size_limit) *
           100.0;
}

bool PerformanceMetrics::has_any_metric() const {
    return page_load_time || dom_content_loaded || first_paint || first_contentful_paint ||
           largest_contentful_paint || cumulative_layout_shift || memory_usage || resource_count;
}

PerformanceMetrics parse_performance_snapshot(const nlohmann::json& payload, double timestamp) {
    PerformanceMetrics metrics;
    metrics.timestamp = timestamp;
    if (!payload.is_object()) {
        return metrics;
    }

    metrics.page_load_time = number_field(payload, "pageLoadTime");
    metrics.dom_content_loaded = number_field(payload, "domContentLoaded");
    metrics.first_paint = number_field(payload, "firstPaint");
    metrics.first_contentful_paint = number_field(payload, "firstContentfulPaint");
    metrics.largest_contentful_paint = number_field(payload, "largestContentfulPaint");
    metrics.cumulative_layout_shift = number_field(payload, "cumulativeLayoutShift");
    metrics.resource_count = integer_field(payload, "resourceCount");

    auto memory = payload.find("memoryUsage");
    if (memory != payload.end() && memory->is_object()) {
        MemoryUsage usage;
        usage.used_js_heap_size = integer_field(*memory, "usedJSHeapSize");
        usage.total_js_heap_size = integer_field(*memory, "totalJSHeapSize");
        usage.js_heap_size_limit = integer_field(*memory, "jsHeapSizeLimit");
        if (usage.used_js_heap_size || usage.total_js_heap_size || usage.js_heap_size_limit) {
            metrics.memory_usage = usage;
        }
    }
    return metrics;
}

void to_json(nlohmann::json& j, const MemoryUsage& memory) {
    j = nlohmann::json{
        {"used_js_heap_size", optional_json(memory.used_js_heap_size)},
        {"total_js_heap_size", optional_json(memory.total_js_heap_size)},
        {"js_heap_size_limit", optional_json(memory.js_heap_size_limit)},
        {"usage_percentage", optional_json(memory.usage_percentage())},
    };
}

void to_json(nlohmann::json& j, const PerformanceMetrics& metrics) {
    j = nlohmann::json{
        {"timestamp", metrics.timestamp},
        {"page_load_time", optional_json(metrics.page_load_time)},
        {"dom_content_loaded", optional_json(metrics.dom_content_loaded)},
        {"first_paint", optional_json(metrics.first_paint)},
        {"first_contentful_paint", optional_json(metrics.first_contentful_paint)},
        {"largest_contentful_paint", optional_json(metrics.largest_contentful_paint)},
        {"cumulative_layout_shift", optional_json(metrics.cumulative_layout_shift)},
        {"memory_usage", optional_json(metrics.memory_usage)},
        {"resource_count", optional_json(metrics.resource_count)},
    };
}

}  // namespace webprobe::perf
