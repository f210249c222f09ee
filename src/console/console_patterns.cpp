#include <webprobe/console/console_patterns.h>

#include <webprobe/core/config.h>

#include <utility>

namespace webprobe::console {

bool ConsolePattern::matches(std::string_view text) const {
    text = text.substr(0, core::config::kClassifyTextLimit);
    return std::regex_search(text.begin(), text.end(), pattern);
}

ConsolePattern make_pattern(std::string name, const std::string& expression,
                            std::string category, ConsoleLevel severity,
                            std::string description, bool action_required) {
    ConsolePattern p;
    p.name = std::move(name);
    p.pattern = std::regex(expression, std::regex::ECMAScript | std::regex::icase |
                                           std::regex::optimize);
    p.category = std::move(category);
    p.severity = severity;
    p.description = std::move(description);
    p.action_required = action_required;
    return p;
}

namespace {

std::vector<ConsolePattern> build_default_patterns() {
    std::vector<ConsolePattern> patterns;

    // JavaScript and request errors
    patterns.push_back(make_pattern(
        "uncaught_exception", R"(Uncaught\s+(TypeError|ReferenceError|SyntaxError|Error))",
        "javascript_error", ConsoleLevel::Error, "Uncaught JavaScript exception", true));
    patterns.push_back(make_pattern(
        "network_error", R"((Failed to load|net::ERR_|NetworkError|fetch.*failed))",
        "network_error", ConsoleLevel::Error, "Network request failure", true));
    patterns.push_back(make_pattern(
        "cors_error", R"((CORS|Cross-Origin|Access-Control-Allow))",
        "cors_error", ConsoleLevel::Error, "CORS policy violation", true));
    patterns.push_back(make_pattern(
        "csp_violation", R"(Content Security Policy|CSP)",
        "security_error", ConsoleLevel::Error, "Content Security Policy violation", true));

    // Performance
    patterns.push_back(make_pattern(
        "performance_warning", R"((slow|performance|optimization|inefficient))",
        "performance_warning", ConsoleLevel::Warning, "Performance-related warning"));
    patterns.push_back(make_pattern(
        "memory_warning", R"((memory|heap|leak|garbage))",
        "memory_warning", ConsoleLevel::Warning, "Memory usage warning"));

    patterns.push_back(make_pattern(
        "deprecation", R"((deprecated|deprecation|will be removed))",
        "deprecation_warning", ConsoleLevel::Warning, "Deprecated API usage"));

    // Frameworks
    patterns.push_back(make_pattern(
        "react_warning", R"(React|Warning.*React)",
        "framework_warning", ConsoleLevel::Warning, "React framework warning"));
    patterns.push_back(make_pattern(
        "vue_warning", R"(Vue warn|Vue\.js)",
        "framework_warning", ConsoleLevel::Warning, "Vue.js framework warning"));
    patterns.push_back(make_pattern(
        "angular_warning", R"(Angular|ng-)",
        "framework_warning", ConsoleLevel::Warning, "Angular framework warning"));

    patterns.push_back(make_pattern(
        "mixed_content", R"(Mixed Content|insecure.*secure)",
        "security_warning", ConsoleLevel::Warning, "Mixed content warning"));

    patterns.push_back(make_pattern(
        "third_party_error", R"((google|facebook|twitter|analytics|gtag|fbq))",
        "third_party_error", ConsoleLevel::Warning, "Third-party service error"));

    patterns.push_back(make_pattern(
        "debug_message", R"((debug|dev|development|console\.log))",
        "debug_message", ConsoleLevel::Debug, "Development/debug message"));

    return patterns;
}

} // namespace

const std::vector<ConsolePattern>& default_console_patterns() {
    static const std::vector<ConsolePattern> patterns = build_default_patterns();
    return patterns;
}

} // namespace webprobe::console
