#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webprobe::console {

enum class ConsoleLevel {
    Error,
    Warning,
    Info,
    Debug,
    Log,
    Assert,
    Other,
};

const char* console_level_name(ConsoleLevel level);

// Unknown level names (trace, table, dir...) map to Other.
ConsoleLevel parse_console_level(std::string_view name);

// Fixed scale: error/assert = 5, warning = 3, info/log = 1, debug = 0.
int severity_score(ConsoleLevel level);

inline constexpr int kCriticalSeverityScore = 5;

struct SourceLocation {
    std::string url;
    std::optional<int> line;
    std::optional<int> column;
};

// A console or page-error signal as delivered by the instrumentation layer.
struct RawConsoleMessage {
    std::string text;
    std::string level = "info";
    std::optional<SourceLocation> location;
    std::optional<std::string> stack_trace;
    std::vector<std::string> args;
    std::optional<double> timestamp;
};

struct ConsoleMessage {
    double timestamp = 0.0;
    double relative_time = 0.0;
    ConsoleLevel level = ConsoleLevel::Info;
    std::string level_name;
    std::string text;
    std::optional<SourceLocation> location;
    std::optional<std::string> stack_trace;
    std::vector<std::string> args;

    // Filled by the classifier
    std::string category = "uncategorized";
    int severity_score = 0;
    std::vector<std::string> patterns_matched;
    bool action_required = false;

    bool is_critical() const {
        return action_required || severity_score >= kCriticalSeverityScore;
    }
};

void to_json(nlohmann::json& j, const SourceLocation& location);
void to_json(nlohmann::json& j, const ConsoleMessage& message);

} // namespace webprobe::console
