#pragma once

#include <webprobe/perf/performance_metrics.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace webprobe::perf {

enum class PerformanceGrade {
    Excellent,
    Good,
    NeedsImprovement,
    Poor,
};

const char* performance_grade_name(PerformanceGrade grade);

struct VitalThresholds {
    double good;
    double needs_improvement;
};

inline constexpr VitalThresholds kLcpThresholds{2500.0, 4000.0};
inline constexpr VitalThresholds kFcpThresholds{1800.0, 3000.0};
inline constexpr VitalThresholds kClsThresholds{0.1, 0.25};

// <= good: Excellent, <= needs_improvement: Good, otherwise Poor.
PerformanceGrade grade_vital(double value, const VitalThresholds& thresholds);

struct VitalReading {
    std::optional<double> value;
    std::optional<PerformanceGrade> grade;
};

struct PerformanceAnalysis {
    std::size_t snapshot_count = 0;

    VitalReading largest_contentful_paint;
    VitalReading first_contentful_paint;
    VitalReading cumulative_layout_shift;

    double overall_score = 50.0;
    PerformanceGrade overall_grade = PerformanceGrade::NeedsImprovement;

    std::optional<double> page_load_time;
    std::optional<double> dom_content_loaded;
    std::optional<double> first_paint;
    std::optional<std::int64_t> resource_count;

    std::optional<double> memory_usage_percentage;
    std::optional<PerformanceGrade> memory_grade;

    std::vector<std::string> bottlenecks;
    std::vector<std::string> recommendations;
    std::vector<std::string> critical_issues;
};

// Grades the newest measured value of each metric across `snapshots`
// (a failed capture does not hide an earlier measurement). Without any
// graded vital the overall score is 50.
PerformanceAnalysis analyze_performance(const std::vector<PerformanceMetrics>& snapshots);

void to_json(nlohmann::json& j, const VitalReading& reading);
void to_json(nlohmann::json& j, const PerformanceAnalysis& analysis);

}  // namespace webprobe::perf
