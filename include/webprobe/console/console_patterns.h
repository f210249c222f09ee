#pragma once

#include <webprobe/console/console_message.h>

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace webprobe::console {

struct ConsolePattern {
    std::string name;
    std::regex pattern;
    std::string category;
    ConsoleLevel severity = ConsoleLevel::Info;
    std::string description;
    bool action_required = false;

    // Scans at most core::config::kClassifyTextLimit leading bytes.
    bool matches(std::string_view text) const;
};

ConsolePattern make_pattern(std::string name, const std::string& expression,
                            std::string category, ConsoleLevel severity,
                            std::string description, bool action_required = false);

// Built-in rule table. Order is part of the contract: rules run from the
// most specific error classes to the generic debug rule, and the category
// of the last matching rule wins.
const std::vector<ConsolePattern>& default_console_patterns();

} // namespace webprobe::console
