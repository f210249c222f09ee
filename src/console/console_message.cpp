#include <webprobe/console/console_message.h>

namespace webprobe::console {

const char* console_level_name(ConsoleLevel level) {
    switch (level) {
        case ConsoleLevel::Error:   return "error";
        case ConsoleLevel::Warning: return "warning";
        case ConsoleLevel::Info:    return "info";
        case ConsoleLevel::Debug:   return "debug";
        case ConsoleLevel::Log:     return "log";
        case ConsoleLevel::Assert:  return "assert";
        case ConsoleLevel::Other:   return "other";
    }
    return "other";
}

ConsoleLevel parse_console_level(std::string_view name) {
    if (name == "error") return ConsoleLevel::Error;
    // Playwright reports "warning", CDP reports "warn"
    if (name == "warning" || name == "warn") return ConsoleLevel::Warning;
    if (name == "info") return ConsoleLevel::Info;
    if (name == "debug") return ConsoleLevel::Debug;
    if (name == "log") return ConsoleLevel::Log;
    if (name == "assert") return ConsoleLevel::Assert;
    return ConsoleLevel::Other;
}

int severity_score(ConsoleLevel level) {
    switch (level) {
        case ConsoleLevel::Error:
        case ConsoleLevel::Assert:
            return 5;
        case ConsoleLevel::Warning:
            return 3;
        case ConsoleLevel::Info:
        case ConsoleLevel::Log:
            return 1;
        case ConsoleLevel::Debug:
        case ConsoleLevel::Other:
            return 0;
    }
    return 0;
}

void to_json(nlohmann::json& j, const SourceLocation& location) {
    j = nlohmann::json{{"url", location.url}};
    j["line"] = location.line ? nlohmann::json(*location.line) : nlohmann::json(nullptr);
    j["column"] = location.column ? nlohmann::json(*location.column) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ConsoleMessage& message) {
    j = nlohmann::json{
        {"timestamp", message.timestamp},
        {"relative_time", message.relative_time},
        {"level", message.level_name},
        {"text", message.text},
        {"category", message.category},
        {"severity_score", message.severity_score},
        {"patterns_matched", message.patterns_matched},
        {"action_required", message.action_required},
    };
    j["location"] = message.location ? nlohmann::json(*message.location) : nlohmann::json(nullptr);
    j["stack_trace"] = message.stack_trace ? nlohmann::json(*message.stack_trace)
                                           : nlohmann::json(nullptr);
}

} // namespace webprobe::console
