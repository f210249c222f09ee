#include <webprobe/core/event.h>

#include <algorithm>

namespace webprobe::core {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::Console:     return "console";
        case EventType::Network:     return "network";
        case EventType::Performance: return "performance";
        case EventType::Error:       return "error";
        case EventType::Interaction: return "interaction";
        case EventType::Navigation:  return "navigation";
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view name) {
    if (name == "console") return EventType::Console;
    if (name == "network") return EventType::Network;
    if (name == "performance") return EventType::Performance;
    if (name == "error") return EventType::Error;
    if (name == "interaction") return EventType::Interaction;
    if (name == "navigation") return EventType::Navigation;
    return std::nullopt;
}

Severity parse_severity(std::string_view name) {
    if (name == "error") return Severity::Error;
    if (name == "warning") return Severity::Warning;
    if (name == "debug") return Severity::Debug;
    return Severity::Info;
}

void to_json(nlohmann::json& j, const BrowserEvent& event) {
    j = nlohmann::json{
        {"timestamp", event.timestamp},
        {"event_type", event_type_name(event.event_type)},
        {"source", event.source},
        {"severity", severity_name(event.severity)},
        {"data", event.data},
    };
}

EventLog::EventLog(std::size_t capacity, TimeSource clock)
    : capacity_(capacity), clock_(or_default_clock(std::move(clock))) {}

void EventLog::record(EventType type, nlohmann::json data, Severity severity) {
    record(type, event_type_name(type), std::move(data), severity);
}

void EventLog::record(EventType type, std::string source, nlohmann::json data, Severity severity) {
    BrowserEvent event;
    event.timestamp = clock_();
    event.event_type = type;
    event.source = std::move(source);
    event.severity = severity;
    event.data = std::move(data);

    events_.push_back(std::move(event));
    ++total_recorded_;
    if (capacity_ != 0 && events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<BrowserEvent> EventLog::recent(std::size_t count) const {
    const std::size_t n = std::min(count, events_.size());
    return std::vector<BrowserEvent>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

std::vector<BrowserEvent> EventLog::events() const {
    return std::vector<BrowserEvent>(events_.begin(), events_.end());
}

std::vector<BrowserEvent> EventLog::events_of_type(EventType type) const {
    std::vector<BrowserEvent> result;
    for (const auto& e : events_) {
        if (e.event_type == type) {
            result.push_back(e);
        }
    }
    return result;
}

std::size_t EventLog::size() const {
    return events_.size();
}

std::uint64_t EventLog::total_recorded() const {
    return total_recorded_;
}

std::size_t EventLog::capacity() const {
    return capacity_;
}

}  // namespace webprobe::core
