#include <webprobe/perf/performance_analysis.h>

#include <iomanip>
#include <sstream>

namespace webprobe::perf {
namespace {

template <typename T, typename Getter>
std::optional<T> newest(const std::vector<PerformanceMetrics>& snapshots, Getter getter) {
    for (auto it = snapshots.rbegin(); it != snapshots.rend(); ++it) {
        if (auto value = getter(*it)) {
            return value;
        }
    }
    return std::nullopt;
}

VitalReading read_vital(std::optional<double> value, const VitalThresholds& thresholds) {
    VitalReading reading;
    reading.value = value;
    if (value) {
        reading.grade = grade_vital(*value, thresholds);
    }
    return reading;
}

// 100 / 75 / 25 for values within good / needs-improvement / beyond.
double vital_score(double value, const VitalThresholds& thresholds) {
    if (value <= thresholds.good) {
        return 100.0;
    }
    if (value <= thresholds.needs_improvement) {
        return 75.0;
    }
    return 25.0;
}

PerformanceGrade grade_overall(double score) {
    if (score >= 90.0) return PerformanceGrade::Excellent;
    if (score >= 75.0) return PerformanceGrade::Good;
    if (score >= 50.0) return PerformanceGrade::NeedsImprovement;
    return PerformanceGrade::Poor;
}

PerformanceGrade grade_memory(double percentage) {
    if (percentage < 50.0) return PerformanceGrade::Excellent;
    if (percentage < 70.0) return PerformanceGrade::Good;
    if (percentage < 85.0) return PerformanceGrade::NeedsImprovement;
    return PerformanceGrade::Poor;
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

const char* performance_grade_name(PerformanceGrade grade) {
    switch (grade) {
        case PerformanceGrade::Excellent:        return "excellent";
        case PerformanceGrade::Good:             return "good";
        case PerformanceGrade::NeedsImprovement: return "needs_improvement";
        case PerformanceGrade::Poor:             return "poor";
    }
    return "unknown";
}

PerformanceGrade grade_vital(double value, const VitalThresholds& thresholds) {
    if (value <= thresholds.good) {
        return PerformanceGrade::Excellent;
    }
    if (value <= thresholds.needs_improvement) {
        return PerformanceGrade::Good;
    }
    return PerformanceGrade::Poor;
}

PerformanceAnalysis analyze_performance(const std::vector<PerformanceMetrics>& snapshots) {
    PerformanceAnalysis analysis;
    analysis.snapshot_count = snapshots.size();

    const auto lcp = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.largest_contentful_paint;
    });
    const auto fcp = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.first_contentful_paint;
    });
    const auto cls = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.cumulative_layout_shift;
    });

    analysis.largest_contentful_paint = read_vital(lcp, kLcpThresholds);
    analysis.first_contentful_paint = read_vital(fcp, kFcpThresholds);
    analysis.cumulative_layout_shift = read_vital(cls, kClsThresholds);

    analysis.page_load_time = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.page_load_time;
    });
    analysis.dom_content_loaded = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.dom_content_loaded;
    });
    analysis.first_paint = newest<double>(snapshots, [](const PerformanceMetrics& m) {
        return m.first_paint;
    });
    analysis.resource_count = newest<std::int64_t>(snapshots, [](const PerformanceMetrics& m) {
        return m.resource_count;
    });

    double score_sum = 0.0;
    int scored = 0;
    if (lcp) { score_sum += vital_score(*lcp, kLcpThresholds); ++scored; }
    if (fcp) { score_sum += vital_score(*fcp, kFcpThresholds); ++scored; }
    if (cls) { score_sum += vital_score(*cls, kClsThresholds); ++scored; }
    if (scored > 0) {
        analysis.overall_score = score_sum / scored;
    }
    analysis.overall_grade = grade_overall(analysis.overall_score);

    double memory_sum = 0.0;
    int memory_samples = 0;
    for (const auto& snapshot : snapshots) {
        if (!snapshot.memory_usage) {
            continue;
        }
        if (auto pct = snapshot.memory_usage->usage_percentage()) {
            memory_sum += *pct;
            ++memory_samples;
            analysis.memory_usage_percentage = pct;
        }
    }
    if (analysis.memory_usage_percentage) {
        analysis.memory_grade = grade_memory(*analysis.memory_usage_percentage);
    }

    if (lcp && *lcp > kLcpThresholds.needs_improvement) {
        analysis.bottlenecks.push_back("Poor Largest Contentful Paint (" + format_fixed(*lcp, 0) +
                                       "ms) - main content loads too slowly");
        analysis.critical_issues.push_back("Critical: Largest Contentful Paint exceeds 4 seconds");
    }
    if (cls && *cls > kClsThresholds.needs_improvement) {
        analysis.bottlenecks.push_back("Poor Cumulative Layout Shift (" + format_fixed(*cls, 3) +
                                       ") - page layout is unstable");
        analysis.critical_issues.push_back(
            "Critical: Cumulative Layout Shift causes poor user experience");
    }
    if (fcp && *fcp > kFcpThresholds.needs_improvement) {
        analysis.bottlenecks.push_back("Slow First Contentful Paint (" + format_fixed(*fcp, 0) +
                                       "ms) - initial content appears too late");
    }
    if (analysis.memory_usage_percentage) {
        const double pct = *analysis.memory_usage_percentage;
        if (pct > 80.0) {
            analysis.bottlenecks.push_back("High memory usage (" + format_fixed(pct, 1) + "%)");
        }
        if (pct > 90.0) {
            analysis.critical_issues.push_back("Critical: Memory usage near limit, risk of crashes");
        }
    }

    if (lcp && *lcp > kLcpThresholds.good) {
        analysis.recommendations.push_back(
            "Optimize Largest Contentful Paint: compress images, use CDN, optimize server "
            "response time");
    }
    if (cls && *cls > kClsThresholds.good) {
        analysis.recommendations.push_back(
            "Fix Cumulative Layout Shift: set image dimensions, avoid dynamic content insertion");
    }
    if (fcp && *fcp > kFcpThresholds.good) {
        analysis.recommendations.push_back(
            "Speed up First Contentful Paint: optimize critical rendering path, inline critical CSS");
    }
    if (memory_samples > 0 && memory_sum / memory_samples > 60.0) {
        analysis.recommendations.push_back(
            "Optimize memory usage: remove memory leaks, optimize data structures");
    }
    if (analysis.resource_count && *analysis.resource_count > 100) {
        analysis.recommendations.push_back(
            "Reduce resource count: implement resource bundling and lazy loading");
    }

    return analysis;
}

void to_json(nlohmann::json& j, const VitalReading& reading) {
    j = nlohmann::json{{"value", optional_json(reading.value)}};
    j["grade"] = reading.grade ? nlohmann::json(performance_grade_name(*reading.grade))
                               : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const PerformanceAnalysis& analysis) {
    j = nlohmann::json{
        {"snapshot_count", analysis.snapshot_count},
        {"overall_score", analysis.overall_score},
        {"overall_grade", performance_grade_name(analysis.overall_grade)},
        {"core_web_vitals", {
            {"lcp", analysis.largest_contentful_paint},
            {"fcp", analysis.first_contentful_paint},
            {"cls", analysis.cumulative_layout_shift},
        }},
        {"timing_metrics", {
            {"page_load_time", optional_json(analysis.page_load_time)},
            {"dom_content_loaded", optional_json(analysis.dom_content_loaded)},
            {"first_paint", optional_json(analysis.first_paint)},
        }},
        {"resource_count", optional_json(analysis.resource_count)},
        {"bottlenecks", analysis.bottlenecks},
        {"recommendations", analysis.recommendations},
        {"critical_issues", analysis.critical_issues},
    };
    j["memory_analysis"] = {
        {"current_usage", optional_json(analysis.memory_usage_percentage)},
        {"grade", analysis.memory_grade ? nlohmann::json(performance_grade_name(*analysis.memory_grade))
                                        : nlohmann::json(nullptr)},
    };
}

}  // namespace webprobe::perf
