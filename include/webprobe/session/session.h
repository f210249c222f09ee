#pragma once

#include <webprobe/console/console_monitor.h>
#include <webprobe/core/clock.h>
#include <webprobe/core/config.h>
#include <webprobe/core/diagnostics.h>
#include <webprobe/core/event.h>
#include <webprobe/net/network_monitor.h>
#include <webprobe/perf/performance_analysis.h>
#include <webprobe/perf/snapshot_assembler.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace webprobe::session {

struct SessionOptions {
    // Stamped on every diagnostic as its correlation id.
    std::uint64_t session_id = 0;
    std::size_t event_log_capacity = core::config::kDefaultEventLogCapacity;
    core::Severity min_diagnostic_severity = core::Severity::Info;
    std::chrono::milliseconds snapshot_timeout = core::config::kSnapshotTimeout;
    bool log_to_stderr = false;
    core::TimeSource clock;
};

struct PageErrorData {
    std::string message;
    std::optional<std::string> stack;
    std::optional<double> timestamp;
};

struct ConsoleStats {
    std::size_t total = 0;
    std::size_t errors = 0;
    std::size_t warnings = 0;
    std::size_t info = 0;
};

struct NetworkStats {
    std::size_t total_requests = 0;  // every request observed, pending included
    std::size_t completed_requests = 0;
    std::size_t failed_requests = 0;  // requests that failed in transport
    std::size_t pending_requests = 0;
    std::map<int, std::size_t> status_codes;
};

struct SessionSummary {
    std::uint64_t session_id = 0;
    double session_duration = 0.0;
    std::uint64_t total_events = 0;
    ConsoleStats console;
    NetworkStats network;
    std::optional<perf::PerformanceMetrics> latest_performance;
    bool monitoring_active = false;
};

void to_json(nlohmann::json& j, const ConsoleStats& stats);
void to_json(nlohmann::json& j, const NetworkStats& stats);
void to_json(nlohmann::json& j, const SessionSummary& summary);

// Telemetry for one browser session. Owns the event log and all monitors;
// every entry point takes the session mutex, so instrumentation callbacks
// may arrive on any thread while reports are read concurrently.
class Session {
public:
    explicit Session(SessionOptions options = {},
                     perf::PerformanceSource* performance_source = nullptr);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void on_console_message(const console::RawConsoleMessage& message);
    void on_page_error(const PageErrorData& error);

    // Returns the request id, or nullopt when monitoring has stopped.
    std::optional<std::string> on_request(const net::RequestData& request);
    void on_response(const std::string& request_id, const net::ResponseData& response);
    void on_request_failed(const std::string& request_id, const std::string& error,
                           std::optional<std::string> blocked_reason = std::nullopt);
    void on_interaction(nlohmann::json data);

    // Records the navigation and captures a performance snapshot for it.
    void on_navigation_complete(const std::string& url);

    // The browser round-trip runs without holding the session lock.
    perf::PerformanceMetrics capture_performance();

    // Marks monitoring inactive. Pending requests stay pending and are
    // reported; later signals are dropped.
    void stop();
    bool is_active() const;

    SessionSummary summary() const;
    console::ConsoleAnalysis console_analysis() const;
    std::vector<console::CriticalIssue> critical_issues() const;
    net::NetworkAnalysis network_analysis() const;
    std::map<std::string, net::DomainStats> domain_analysis() const;
    perf::PerformanceAnalysis performance_analysis() const;
    std::vector<perf::PerformanceMetrics> performance_snapshots() const;
    std::vector<core::BrowserEvent> recent_events(std::size_t count) const;

    // Console, network and performance exports plus the session summary
    // and the recent event timeline.
    nlohmann::json export_report() const;

    core::DiagnosticEmitter& diagnostics();
    std::uint64_t id() const;

private:
    bool accepting(const char* signal);
    SessionSummary summary_locked() const;

    SessionOptions options_;
    core::TimeSource clock_;
    double start_time_;
    core::DiagnosticEmitter diagnostics_;

    mutable std::mutex mutex_;
    core::EventLog events_;
    console::ConsoleMonitor console_;
    net::NetworkMonitor network_;
    perf::SnapshotAssembler assembler_;
    bool active_ = true;
};

}  // namespace webprobe::session
