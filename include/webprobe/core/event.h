#pragma once

#include <webprobe/core/clock.h>
#include <webprobe/core/config.h>
#include <webprobe/core/diagnostics.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webprobe::core {

enum class EventType {
    Console,
    Network,
    Performance,
    Error,
    Interaction,
    Navigation,
};

const char* event_type_name(EventType type);
std::optional<EventType> parse_event_type(std::string_view name);

// Parses "error" | "warning" | "info" | "debug"; anything else is Info.
Severity parse_severity(std::string_view name);

struct BrowserEvent {
    double timestamp = 0.0;
    EventType event_type = EventType::Console;
    std::string source;
    Severity severity = Severity::Info;
    nlohmann::json data;
};

void to_json(nlohmann::json& j, const BrowserEvent& event);

// Append-only arrival-ordered log of session events. When a capacity is
// set only the newest `capacity` events are retained; total_recorded()
// still counts every event.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = config::kDefaultEventLogCapacity,
                      TimeSource clock = {});

    void record(EventType type, nlohmann::json data, Severity severity = Severity::Info);
    void record(EventType type, std::string source, nlohmann::json data, Severity severity);

    // Last `count` retained events, oldest first.
    std::vector<BrowserEvent> recent(std::size_t count) const;
    std::vector<BrowserEvent> events() const;
    std::vector<BrowserEvent> events_of_type(EventType type) const;

    std::size_t size() const;
    std::uint64_t total_recorded() const;
    std::size_t capacity() const;

private:
    std::deque<BrowserEvent> events_;
    std::size_t capacity_;
    std::uint64_t total_recorded_ = 0;
    TimeSource clock_;
};

}  // namespace webprobe::core
