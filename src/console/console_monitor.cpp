#include <webprobe/console/console_monitor.h>

#include <webprobe/core/config.h>
#include <webprobe/core/text.h>

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace webprobe::console {
namespace {

constexpr const char* kModule = "console";

std::size_t category_count(const std::map<std::string, std::size_t>& categories,
                           const std::string& name) {
    auto it = categories.find(name);
    return it == categories.end() ? 0 : it->second;
}

// Message indices ordered newest first. Equal timestamps keep arrival
// order reversed so the later message still counts as newer.
std::vector<std::size_t> newest_first(const std::vector<ConsoleMessage>& messages,
                                      std::vector<std::size_t> indices) {
    std::reverse(indices.begin(), indices.end());
    std::stable_sort(indices.begin(), indices.end(), [&](std::size_t a, std::size_t b) {
        return messages[a].timestamp > messages[b].timestamp;
    });
    return indices;
}

} // namespace

ConsoleMonitor::ConsoleMonitor(core::DiagnosticEmitter* diagnostics, core::TimeSource clock)
    : ConsoleMonitor(default_console_patterns(), diagnostics, std::move(clock)) {}

ConsoleMonitor::ConsoleMonitor(std::vector<ConsolePattern> patterns,
                               core::DiagnosticEmitter* diagnostics,
                               core::TimeSource clock)
    : patterns_(std::move(patterns)),
      diagnostics_(diagnostics),
      clock_(core::or_default_clock(std::move(clock))),
      start_time_(clock_()) {}

void ConsoleMonitor::classify(ConsoleMessage& message) const {
    for (const auto& rule : patterns_) {
        if (!rule.matches(message.text)) {
            continue;
        }
        message.patterns_matched.push_back(rule.name);
        message.category = rule.category;
        message.severity_score = std::max(message.severity_score, severity_score(rule.severity));
        if (rule.action_required) {
            message.action_required = true;
        }
    }
}

const ConsoleMessage& ConsoleMonitor::add_message(const RawConsoleMessage& raw) {
    ConsoleMessage message;
    message.timestamp = raw.timestamp.value_or(clock_());
    message.relative_time = message.timestamp - start_time_;
    message.level = parse_console_level(raw.level);
    message.level_name = raw.level;
    message.text = raw.text;
    message.location = raw.location;
    message.stack_trace = raw.stack_trace;
    message.args = raw.args;

    classify(message);

    categories_[message.category].push_back(messages_.size());
    messages_.push_back(std::move(message));
    const ConsoleMessage& stored = messages_.back();

    if (diagnostics_) {
        if (stored.severity_score >= kCriticalSeverityScore) {
            diagnostics_->warning(kModule, "ingest",
                                  "Critical console issue detected: " +
                                      core::preview_text(stored.text, core::config::kTextPreviewLength));
        } else {
            diagnostics_->debug(kModule, "ingest", "Classified console message as " + stored.category);
        }
    }
    return stored;
}

ConsoleAnalysis ConsoleMonitor::get_analysis() const {
    ConsoleAnalysis analysis;
    if (messages_.empty()) {
        return analysis;
    }

    analysis.total_messages = messages_.size();
    for (const auto& msg : messages_) {
        switch (msg.level) {
            case ConsoleLevel::Error:
                ++analysis.error_count;
                break;
            case ConsoleLevel::Warning:
                ++analysis.warning_count;
                break;
            case ConsoleLevel::Info:
            case ConsoleLevel::Log:
                ++analysis.info_count;
                break;
            default:
                break;
        }
    }

    for (const auto& [category, indices] : categories_) {
        analysis.categories[category] = indices.size();
    }

    std::vector<std::size_t> critical;
    for (std::size_t i = 0; i < messages_.size(); ++i) {
        if (messages_[i].is_critical()) {
            critical.push_back(i);
        }
    }
    critical = newest_first(messages_, std::move(critical));
    if (critical.size() > core::config::kCriticalIssueLimit) {
        critical.resize(core::config::kCriticalIssueLimit);
    }
    for (std::size_t index : critical) {
        analysis.critical_issues.push_back(
            core::preview_text(messages_[index].text, core::config::kTextPreviewLength));
    }

    // Frequency list; ties keep rule-table order.
    for (const auto& rule : patterns_) {
        std::size_t count = 0;
        for (const auto& msg : messages_) {
            count += static_cast<std::size_t>(
                std::count(msg.patterns_matched.begin(), msg.patterns_matched.end(), rule.name));
        }
        if (count > 0) {
            analysis.patterns_detected.push_back({rule.name, count});
        }
    }
    std::stable_sort(analysis.patterns_detected.begin(), analysis.patterns_detected.end(),
                     [](const PatternCount& a, const PatternCount& b) { return a.count > b.count; });

    analysis.recommendations = generate_recommendations(analysis.categories);

    const long total_severity = std::accumulate(
        messages_.begin(), messages_.end(), 0L,
        [](long sum, const ConsoleMessage& msg) { return sum + msg.severity_score; });
    analysis.severity_score =
        static_cast<double>(total_severity) / static_cast<double>(messages_.size());

    return analysis;
}

std::vector<std::string> ConsoleMonitor::generate_recommendations(
    const std::map<std::string, std::size_t>& categories) const {
    std::vector<std::string> recommendations;

    const std::size_t js_errors = category_count(categories, "javascript_error");
    const std::size_t network_errors = category_count(categories, "network_error");

    if (js_errors > 0) {
        recommendations.push_back("Fix " + std::to_string(js_errors) +
                                  " JavaScript errors to improve application stability");
    }
    if (network_errors > 0) {
        recommendations.push_back("Investigate " + std::to_string(network_errors) +
                                  " network failures - check API endpoints and connectivity");
    }
    if (category_count(categories, "cors_error") > 0) {
        recommendations.push_back(
            "Configure CORS headers properly to resolve cross-origin request issues");
    }
    if (category_count(categories, "performance_warning") > 0) {
        recommendations.push_back("Address performance warnings to improve user experience");
    }
    if (category_count(categories, "security_error") > 0 ||
        category_count(categories, "security_warning") > 0) {
        recommendations.push_back(
            "Review and fix security-related issues (CSP violations, mixed content)");
    }
    if (category_count(categories, "deprecation_warning") > 0) {
        recommendations.push_back(
            "Update deprecated API usage to prevent future compatibility issues");
    }
    if (category_count(categories, "framework_warning") > 0) {
        recommendations.push_back(
            "Address framework-specific warnings to ensure optimal performance");
    }
    if (category_count(categories, "debug_message") > 5) {
        recommendations.push_back(
            "Remove debug/development console messages from production code");
    }
    if (js_errors + network_errors > 10) {
        recommendations.push_back(
            "High error volume detected - prioritize error resolution for better user experience");
    }

    return recommendations;
}

std::vector<CriticalIssue> ConsoleMonitor::get_critical_issues() const {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < messages_.size(); ++i) {
        if (messages_[i].is_critical()) {
            indices.push_back(i);
        }
    }

    std::vector<CriticalIssue> issues;
    issues.reserve(indices.size());
    for (std::size_t index : newest_first(messages_, std::move(indices))) {
        const auto& msg = messages_[index];
        issues.push_back(CriticalIssue{msg.timestamp, msg.level_name, msg.text, msg.category,
                                       msg.patterns_matched, msg.location});
    }
    return issues;
}

CategorySummary ConsoleMonitor::get_category_summary(const std::string& category) const {
    CategorySummary summary;
    summary.category = category;

    auto it = categories_.find(category);
    if (it == categories_.end()) {
        return summary;
    }

    const auto& indices = it->second;
    summary.count = indices.size();

    const std::size_t keep = std::min(indices.size(), core::config::kCategoryMessageLimit);
    for (auto idx = indices.end() - static_cast<std::ptrdiff_t>(keep); idx != indices.end(); ++idx) {
        summary.messages.push_back(messages_[*idx]);
    }

    std::set<std::string> unique_texts;
    for (std::size_t index : indices) {
        const auto& msg = messages_[index];
        if (!summary.first_occurrence || msg.timestamp < *summary.first_occurrence) {
            summary.first_occurrence = msg.timestamp;
        }
        if (!summary.last_occurrence || msg.timestamp > *summary.last_occurrence) {
            summary.last_occurrence = msg.timestamp;
        }
        unique_texts.insert(msg.text);
    }
    summary.unique_messages = unique_texts.size();
    return summary;
}

nlohmann::json ConsoleMonitor::export_summary() const {
    nlohmann::json summary;
    summary["monitoring_duration"] = clock_() - start_time_;
    summary["analysis"] = get_analysis();

    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [category, indices] : categories_) {
        categories[category] = get_category_summary(category);
    }
    summary["categories"] = std::move(categories);
    summary["critical_issues"] = get_critical_issues();

    std::vector<std::size_t> order(messages_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return messages_[a].timestamp < messages_[b].timestamp;
    });
    const std::size_t keep = std::min(order.size(), core::config::kTimelineLimit);

    nlohmann::json timeline = nlohmann::json::array();
    for (auto it = order.end() - static_cast<std::ptrdiff_t>(keep); it != order.end(); ++it) {
        const auto& msg = messages_[*it];
        timeline.push_back({
            {"timestamp", msg.timestamp},
            {"relative_time", msg.relative_time},
            {"level", msg.level_name},
            {"category", msg.category},
            {"text", core::preview_text(msg.text, core::config::kTextPreviewLength)},
        });
    }
    summary["timeline"] = std::move(timeline);
    return summary;
}

const std::vector<ConsoleMessage>& ConsoleMonitor::messages() const {
    return messages_;
}

std::size_t ConsoleMonitor::size() const {
    return messages_.size();
}

double ConsoleMonitor::start_time() const {
    return start_time_;
}

void to_json(nlohmann::json& j, const PatternCount& pattern) {
    j = nlohmann::json{{"name", pattern.name}, {"count", pattern.count}};
}

void to_json(nlohmann::json& j, const ConsoleAnalysis& analysis) {
    j = nlohmann::json{
        {"total_messages", analysis.total_messages},
        {"error_count", analysis.error_count},
        {"warning_count", analysis.warning_count},
        {"info_count", analysis.info_count},
        {"categories", analysis.categories},
        {"critical_issues", analysis.critical_issues},
        {"patterns_detected", analysis.patterns_detected},
        {"recommendations", analysis.recommendations},
        {"severity_score", analysis.severity_score},
    };
}

void to_json(nlohmann::json& j, const CriticalIssue& issue) {
    j = nlohmann::json{
        {"timestamp", issue.timestamp},
        {"level", issue.level},
        {"text", issue.text},
        {"category", issue.category},
        {"patterns", issue.patterns},
    };
    j["location"] = issue.location ? nlohmann::json(*issue.location) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const CategorySummary& summary) {
    j = nlohmann::json{
        {"category", summary.category},
        {"count", summary.count},
        {"messages", summary.messages},
        {"unique_messages", summary.unique_messages},
    };
    j["first_occurrence"] = summary.first_occurrence ? nlohmann::json(*summary.first_occurrence)
                                                     : nlohmann::json(nullptr);
    j["last_occurrence"] = summary.last_occurrence ? nlohmann::json(*summary.last_occurrence)
                                                   : nlohmann::json(nullptr);
}

} // namespace webprobe::console
