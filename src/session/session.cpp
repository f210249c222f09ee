#include <webprobe/session/session.h>

#include <string>
#include <utility>

namespace webprobe::session {
namespace {

constexpr const char* kModule = "session";

core::Severity console_event_severity(console::ConsoleLevel level) {
    switch (level) {
        case console::ConsoleLevel::Error:
        case console::ConsoleLevel::Assert:
            return core::Severity::Error;
        case console::ConsoleLevel::Warning:
            return core::Severity::Warning;
        default:
            return core::Severity::Info;
    }
}

}  // namespace

void to_json(nlohmann::json& j, const ConsoleStats& stats) {
    j = nlohmann::json{
        {"total", stats.total},
        {"errors", stats.errors},
        {"warnings", stats.warnings},
        {"info", stats.info},
    };
}

void to_json(nlohmann::json& j, const NetworkStats& stats) {
    nlohmann::json codes = nlohmann::json::object();
    for (const auto& [status, count] : stats.status_codes) {
        codes[std::to_string(status)] = count;
    }
    j = nlohmann::json{
        {"total_requests", stats.total_requests},
        {"completed_requests", stats.completed_requests},
        {"failed_requests", stats.failed_requests},
        {"pending_requests", stats.pending_requests},
        {"status_codes", codes},
    };
}

void to_json(nlohmann::json& j, const SessionSummary& summary) {
    j = nlohmann::json{
        {"session_id", summary.session_id},
        {"session_duration", summary.session_duration},
        {"total_events", summary.total_events},
        {"console_stats", summary.console},
        {"network_stats", summary.network},
        {"monitoring_active", summary.monitoring_active},
    };
    if (summary.latest_performance) {
        j["performance"] = *summary.latest_performance;
    } else {
        j["performance"] = nullptr;
    }
}

Session::Session(SessionOptions options, perf::PerformanceSource* performance_source)
    : options_(std::move(options)),
      clock_(core::or_default_clock(options_.clock)),
      start_time_(clock_()),
      events_(options_.event_log_capacity, clock_),
      console_(&diagnostics_, clock_),
      network_(&diagnostics_, clock_),
      assembler_(performance_source, &diagnostics_, clock_, options_.snapshot_timeout) {
    diagnostics_.set_correlation_id(options_.session_id);
    diagnostics_.set_min_severity(options_.min_diagnostic_severity);
    diagnostics_.set_retention_limit(core::config::kDiagnosticRetention);
    if (options_.log_to_stderr) {
        diagnostics_.add_observer(core::stderr_observer());
    }
    diagnostics_.info(kModule, "start",
                      "Monitoring started for session " + std::to_string(options_.session_id));
}

bool Session::accepting(const char* signal) {
    if (active_) {
        return true;
    }
    diagnostics_.debug(kModule, "ingest",
                       std::string("Dropped ") + signal + " signal after stop");
    return false;
}

void Session::on_console_message(const console::RawConsoleMessage& message) {
    std::lock_guard lock(mutex_);
    if (!accepting("console")) {
        return;
    }
    const auto& stored = console_.add_message(message);
    events_.record(core::EventType::Console,
                   nlohmann::json{
                       {"level", stored.level_name},
                       {"text", stored.text},
                       {"category", stored.category},
                       {"severity_score", stored.severity_score},
                   },
                   console_event_severity(stored.level));
}

void Session::on_page_error(const PageErrorData& error) {
    std::lock_guard lock(mutex_);
    if (!accepting("page error")) {
        return;
    }
    console::RawConsoleMessage raw;
    raw.text = error.message;
    raw.level = "error";
    raw.stack_trace = error.stack;
    raw.timestamp = error.timestamp;
    console_.add_message(raw);

    nlohmann::json data{
        {"type", "javascript_error"},
        {"message", error.message},
    };
    data["stack"] = error.stack ? nlohmann::json(*error.stack) : nlohmann::json(nullptr);
    events_.record(core::EventType::Error, std::move(data), core::Severity::Error);
}

std::optional<std::string> Session::on_request(const net::RequestData& request) {
    std::lock_guard lock(mutex_);
    if (!accepting("request")) {
        return std::nullopt;
    }
    std::string id = network_.add_request(request);
    events_.record(core::EventType::Network,
                   nlohmann::json{
                       {"type", "request"},
                       {"request_id", id},
                       {"url", request.url},
                       {"method", request.method},
                       {"resource_type", request.resource_type},
                   });
    return id;
}

void Session::on_response(const std::string& request_id, const net::ResponseData& response) {
    std::lock_guard lock(mutex_);
    if (!accepting("response")) {
        return;
    }
    const bool correlated = network_.add_response(request_id, response);

    nlohmann::json data{
        {"type", "response"},
        {"request_id", request_id},
        {"correlated", correlated},
    };
    data["status"] = response.status ? nlohmann::json(*response.status) : nlohmann::json(nullptr);
    if (const auto* request = network_.find(request_id)) {
        data["url"] = request->url;
    }
    events_.record(core::EventType::Network, std::move(data));
}

void Session::on_request_failed(const std::string& request_id, const std::string& error,
                                std::optional<std::string> blocked_reason) {
    std::lock_guard lock(mutex_);
    if (!accepting("request failure")) {
        return;
    }
    nlohmann::json data{
        {"type", "request_failed"},
        {"request_id", request_id},
        {"error", error},
    };
    data["blocked_reason"] = blocked_reason ? nlohmann::json(*blocked_reason) : nlohmann::json(nullptr);

    const bool correlated = network_.add_request_failure(request_id, error, std::move(blocked_reason));
    data["correlated"] = correlated;
    if (const auto* request = network_.find(request_id)) {
        data["url"] = request->url;
    }
    events_.record(core::EventType::Network, std::move(data), core::Severity::Error);
}

void Session::on_interaction(nlohmann::json data) {
    std::lock_guard lock(mutex_);
    if (!accepting("interaction")) {
        return;
    }
    events_.record(core::EventType::Interaction, std::move(data));
}

void Session::on_navigation_complete(const std::string& url) {
    {
        std::lock_guard lock(mutex_);
        if (!accepting("navigation")) {
            return;
        }
        events_.record(core::EventType::Navigation, nlohmann::json{{"url", url}});
    }
    capture_performance();
}

perf::PerformanceMetrics Session::capture_performance() {
    {
        std::lock_guard lock(mutex_);
        if (!accepting("performance")) {
            perf::PerformanceMetrics empty;
            empty.timestamp = clock_();
            return empty;
        }
    }

    perf::PerformanceMetrics metrics = assembler_.collect();

    std::lock_guard lock(mutex_);
    if (!active_) {
        diagnostics_.debug(kModule, "ingest", "Discarded performance snapshot completed after stop");
        return metrics;
    }
    assembler_.record(metrics);
    events_.record(core::EventType::Performance, nlohmann::json(metrics));
    return metrics;
}

void Session::stop() {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return;
    }
    active_ = false;
    diagnostics_.info(kModule, "stop",
                      "Monitoring stopped with " + std::to_string(network_.pending_count()) +
                          " pending requests");
}

bool Session::is_active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

SessionSummary Session::summary_locked() const {
    SessionSummary summary;
    summary.session_id = options_.session_id;
    summary.session_duration = clock_() - start_time_;
    summary.total_events = events_.total_recorded();
    summary.monitoring_active = active_;

    const auto console = console_.get_analysis();
    summary.console.total = console.total_messages;
    summary.console.errors = console.error_count;
    summary.console.warnings = console.warning_count;
    summary.console.info = console.info_count;

    const auto network = network_.get_analysis();
    summary.network.completed_requests = network.total_requests;
    summary.network.pending_requests = network_.pending_count();
    summary.network.total_requests = network.total_requests + summary.network.pending_requests;
    // Transport failures only; HTTP error statuses show in status_codes.
    for (const net::NetworkRequest* request : network_.completed_requests()) {
        if (request->error) {
            ++summary.network.failed_requests;
        }
    }
    summary.network.status_codes = network.status_codes;

    summary.latest_performance = assembler_.latest();
    return summary;
}

SessionSummary Session::summary() const {
    std::lock_guard lock(mutex_);
    return summary_locked();
}

console::ConsoleAnalysis Session::console_analysis() const {
    std::lock_guard lock(mutex_);
    return console_.get_analysis();
}

std::vector<console::CriticalIssue> Session::critical_issues() const {
    std::lock_guard lock(mutex_);
    return console_.get_critical_issues();
}

net::NetworkAnalysis Session::network_analysis() const {
    std::lock_guard lock(mutex_);
    return network_.get_analysis();
}

std::map<std::string, net::DomainStats> Session::domain_analysis() const {
    std::lock_guard lock(mutex_);
    return network_.get_domain_analysis();
}

perf::PerformanceAnalysis Session::performance_analysis() const {
    std::lock_guard lock(mutex_);
    return perf::analyze_performance(assembler_.snapshots());
}

std::vector<perf::PerformanceMetrics> Session::performance_snapshots() const {
    std::lock_guard lock(mutex_);
    return assembler_.snapshots();
}

std::vector<core::BrowserEvent> Session::recent_events(std::size_t count) const {
    std::lock_guard lock(mutex_);
    return events_.recent(count);
}

nlohmann::json Session::export_report() const {
    std::lock_guard lock(mutex_);
    return nlohmann::json{
        {"session", summary_locked()},
        {"console", console_.export_summary()},
        {"network", network_.export_summary()},
        {"performance",
         {
             {"analysis", perf::analyze_performance(assembler_.snapshots())},
             {"snapshots", assembler_.snapshots()},
         }},
        {"timeline", events_.recent(core::config::kTimelineLimit)},
    };
}

core::DiagnosticEmitter& Session::diagnostics() {
    return diagnostics_;
}

std::uint64_t Session::id() const {
    return options_.session_id;
}

}  // namespace webprobe::session
