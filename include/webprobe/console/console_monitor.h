#pragma once

#include <webprobe/console/console_message.h>
#include <webprobe/console/console_patterns.h>
#include <webprobe/core/clock.h>
#include <webprobe/core/diagnostics.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace webprobe::console {

struct PatternCount {
    std::string name;
    std::size_t count = 0;
};

struct ConsoleAnalysis {
    std::size_t total_messages = 0;
    std::size_t error_count = 0;
    std::size_t warning_count = 0;
    std::size_t info_count = 0;  // info + log levels
    std::map<std::string, std::size_t> categories;
    std::vector<std::string> critical_issues;  // newest first
    std::vector<PatternCount> patterns_detected;  // most frequent first
    std::vector<std::string> recommendations;
    double severity_score = 0.0;  // mean over all messages
};

struct CriticalIssue {
    double timestamp = 0.0;
    std::string level;
    std::string text;
    std::string category;
    std::vector<std::string> patterns;
    std::optional<SourceLocation> location;
};

struct CategorySummary {
    std::string category;
    std::size_t count = 0;
    std::vector<ConsoleMessage> messages;  // most recent, oldest first
    std::optional<double> first_occurrence;
    std::optional<double> last_occurrence;
    std::size_t unique_messages = 0;
};

void to_json(nlohmann::json& j, const PatternCount& pattern);
void to_json(nlohmann::json& j, const ConsoleAnalysis& analysis);
void to_json(nlohmann::json& j, const CriticalIssue& issue);
void to_json(nlohmann::json& j, const CategorySummary& summary);

// Classifies console output against an ordered rule table and aggregates
// the result. Single consumer: callers serialize access.
class ConsoleMonitor {
public:
    explicit ConsoleMonitor(core::DiagnosticEmitter* diagnostics = nullptr,
                            core::TimeSource clock = {});
    ConsoleMonitor(std::vector<ConsolePattern> patterns,
                   core::DiagnosticEmitter* diagnostics = nullptr,
                   core::TimeSource clock = {});

    // Returns the classified message as stored.
    const ConsoleMessage& add_message(const RawConsoleMessage& raw);

    ConsoleAnalysis get_analysis() const;
    std::vector<CriticalIssue> get_critical_issues() const;
    CategorySummary get_category_summary(const std::string& category) const;
    nlohmann::json export_summary() const;

    const std::vector<ConsoleMessage>& messages() const;
    std::size_t size() const;
    double start_time() const;

private:
    void classify(ConsoleMessage& message) const;
    std::vector<std::string> generate_recommendations(
        const std::map<std::string, std::size_t>& categories) const;

    std::vector<ConsolePattern> patterns_;
    std::vector<ConsoleMessage> messages_;
    // category -> indices into messages_
    std::map<std::string, std::vector<std::size_t>> categories_;
    core::DiagnosticEmitter* diagnostics_;
    core::TimeSource clock_;
    double start_time_;
};

} // namespace webprobe::console
