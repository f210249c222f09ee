#include <webprobe/core/diagnostics.h>
#include <webprobe/core/event.h>
#include <webprobe/core/text.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace webprobe::core;

namespace {

TimeSource manual_clock(double& now) {
    return [&now]() { return now; };
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. Diagnostics below the minimum severity are discarded
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, MinSeverityFiltersEvents) {
    DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(Severity::Warning);

    diagnostics.debug("console", "ingest", "classified");
    diagnostics.info("session", "start", "started");
    diagnostics.warning("network", "correlate", "unknown request");
    diagnostics.error("perf", "capture", "failed");

    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics.events()[0].severity, Severity::Warning);
    EXPECT_EQ(diagnostics.events()[1].severity, Severity::Error);
}

// ---------------------------------------------------------------------------
// 2. Correlation id is stamped on every event
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, CorrelationIdStamped) {
    DiagnosticEmitter diagnostics;
    diagnostics.set_correlation_id(42);
    diagnostics.info("session", "start", "started");

    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.events()[0].correlation_id, 42u);
    EXPECT_EQ(format_diagnostic(diagnostics.events()[0]),
              "[info] session/start (cid:42): started");
}

// ---------------------------------------------------------------------------
// 3. Retention limit drops the oldest events
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, RetentionLimitKeepsNewest) {
    DiagnosticEmitter diagnostics;
    diagnostics.set_retention_limit(3);
    for (int i = 0; i < 5; ++i) {
        diagnostics.info("network", "ingest", "event " + std::to_string(i));
    }

    auto events = diagnostics.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().message, "event 2");
    EXPECT_EQ(events.back().message, "event 4");
}

// ---------------------------------------------------------------------------
// 4. Observers see each accepted event and may query the emitter
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, ObserverReceivesEvents) {
    DiagnosticEmitter diagnostics;
    std::vector<std::string> seen;
    diagnostics.add_observer([&](const DiagnosticEvent& event) {
        seen.push_back(event.module + ":" + event.message);
        EXPECT_GE(diagnostics.size(), 1u);
    });

    diagnostics.warning("console", "ingest", "critical");
    diagnostics.error("perf", "capture", "timeout");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "console:critical");
    EXPECT_EQ(seen[1], "perf:timeout");
}

// ---------------------------------------------------------------------------
// 5. Filtering by module and severity
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, FilterByModuleAndSeverity) {
    DiagnosticEmitter diagnostics;
    diagnostics.warning("network", "correlate", "a");
    diagnostics.debug("network", "ingest", "b");
    diagnostics.warning("console", "ingest", "c");

    EXPECT_EQ(diagnostics.events_by_module("network").size(), 2u);
    EXPECT_EQ(diagnostics.events_by_severity(Severity::Warning).size(), 2u);

    diagnostics.clear();
    EXPECT_EQ(diagnostics.size(), 0u);
}

// ---------------------------------------------------------------------------
// 6. Event log records with the injected clock
// ---------------------------------------------------------------------------
TEST(EventLogTest, RecordsInArrivalOrder) {
    double now = 10.0;
    EventLog log(0, manual_clock(now));

    log.record(EventType::Console, nlohmann::json{{"text", "a"}});
    now = 11.5;
    log.record(EventType::Network, "network", nlohmann::json{{"url", "https://a.com"}},
               Severity::Error);

    auto events = log.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_DOUBLE_EQ(events[0].timestamp, 10.0);
    EXPECT_EQ(events[0].source, "console");
    EXPECT_EQ(events[0].severity, Severity::Info);
    EXPECT_DOUBLE_EQ(events[1].timestamp, 11.5);
    EXPECT_EQ(events[1].severity, Severity::Error);
    EXPECT_EQ(log.events_of_type(EventType::Network).size(), 1u);
}

// ---------------------------------------------------------------------------
// 7. Bounded log keeps the newest events but counts all of them
// ---------------------------------------------------------------------------
TEST(EventLogTest, CapacityDropsOldest) {
    double now = 0.0;
    EventLog log(3, manual_clock(now));
    for (int i = 0; i < 5; ++i) {
        log.record(EventType::Interaction, nlohmann::json{{"n", i}});
    }

    EXPECT_EQ(log.size(), 3u);
    EXPECT_EQ(log.total_recorded(), 5u);
    auto recent = log.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].data["n"], 3);
    EXPECT_EQ(recent[1].data["n"], 4);
    EXPECT_EQ(log.recent(10).size(), 3u);
}

// ---------------------------------------------------------------------------
// 8. Event JSON form
// ---------------------------------------------------------------------------
TEST(EventLogTest, EventToJson) {
    BrowserEvent event;
    event.timestamp = 3.0;
    event.event_type = EventType::Navigation;
    event.source = "navigation";
    event.severity = Severity::Warning;
    event.data = nlohmann::json{{"url", "https://a.com"}};

    nlohmann::json j = event;
    EXPECT_EQ(j["event_type"], "navigation");
    EXPECT_EQ(j["severity"], "warning");
    EXPECT_EQ(j["data"]["url"], "https://a.com");
}

// ---------------------------------------------------------------------------
// 9. Event type and severity names round-trip
// ---------------------------------------------------------------------------
TEST(EventLogTest, ParseNames) {
    EXPECT_EQ(parse_event_type("performance"), EventType::Performance);
    EXPECT_FALSE(parse_event_type("bogus").has_value());
    EXPECT_EQ(parse_severity("error"), Severity::Error);
    EXPECT_EQ(parse_severity("whatever"), Severity::Info);
}

// ---------------------------------------------------------------------------
// 10. Preview text truncation
// ---------------------------------------------------------------------------
TEST(TextTest, PreviewTruncatesLongText) {
    EXPECT_EQ(preview_text("short", 100), "short");

    const std::string long_text(150, 'x');
    auto preview = preview_text(long_text, 100);
    EXPECT_EQ(preview.size(), 103u);
    EXPECT_EQ(preview.substr(100), "...");
}

TEST(TextTest, PreviewDoesNotSplitMultibyteCharacters) {
    // "é" is two bytes; a cut at byte 3 would land inside the second one.
    const std::string text = "a\xC3\xA9\xC3\xA9zz";
    EXPECT_EQ(preview_text(text, 4), "a\xC3\xA9...");
}

TEST(TextTest, LowerAscii) {
    EXPECT_EQ(to_lower_ascii("CDN.Example.COM"), "cdn.example.com");
}
