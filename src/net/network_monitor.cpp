#include <webprobe/net/network_monitor.h>

#include <webprobe/core/config.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace webprobe::net {
namespace {

constexpr const char* kModule = "network";

RankedRequest rank_entry(const NetworkRequest& request) {
    RankedRequest entry;
    entry.url = request.url;
    entry.method = request.method;
    entry.duration_ms = request.duration_ms().value_or(0.0);
    entry.status = request.response_status;
    entry.size = request.size;
    entry.cache_hit = request.cache_hit;
    return entry;
}

bool has_reportable_status(const NetworkRequest& request) {
    return request.response_status && *request.response_status != 0;
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

void analyze_issues(const NetworkAnalysis& analysis,
                    std::vector<std::string>& issues,
                    std::vector<std::string>& recommendations) {
    const std::size_t total = analysis.total_requests;

    // Strictly more than 10% of requests.
    if (analysis.failed_requests * 10 > total) {
        const double failure_rate =
            static_cast<double>(analysis.failed_requests) / static_cast<double>(total);
        issues.push_back("High network failure rate: " + format_fixed(failure_rate * 100.0, 1) +
                         "% of requests failed");
        recommendations.push_back(
            "Investigate network failures - check API endpoints and server status");
    }

    if (analysis.average_response_time > 2000.0) {
        issues.push_back("Slow average response time: " +
                         format_fixed(analysis.average_response_time, 0) + "ms");
        recommendations.push_back(
            "Optimize API response times - consider caching, CDN, or server optimization");
    } else if (analysis.average_response_time > 1000.0) {
        recommendations.push_back("Consider optimizing response times for better user experience");
    }

    std::size_t client_errors = 0;
    std::size_t server_errors = 0;
    for (const auto& [status, count] : analysis.status_codes) {
        if (status >= 400 && status < 500) {
            client_errors += count;
        } else if (status >= 500) {
            server_errors += count;
        }
    }
    if (client_errors > 0) {
        issues.push_back("Client errors detected: " + std::to_string(client_errors) +
                         " requests with 4xx status codes");
        recommendations.push_back(
            "Review client-side requests - check URLs, parameters, and authentication");
    }
    if (server_errors > 0) {
        issues.push_back("Server errors detected: " + std::to_string(server_errors) +
                         " requests with 5xx status codes");
        recommendations.push_back("Investigate server-side issues - check server logs and health");
    }

    if (analysis.domains.size() > 10) {
        issues.push_back("High number of domains: " + std::to_string(analysis.domains.size()) +
                         " different domains contacted");
        recommendations.push_back(
            "Consider reducing external dependencies to improve loading performance");
    }

    if (total > 100) {
        recommendations.push_back(
            "High request volume detected - consider request bundling or optimization");
    }

    auto type_count = [&](const std::string& type) -> std::size_t {
        auto it = analysis.resource_types.find(type);
        return it == analysis.resource_types.end() ? 0 : it->second;
    };
    if (type_count("image") > 20) {
        recommendations.push_back(
            "Many image requests detected - consider image optimization and lazy loading");
    }
    if (type_count("script") > 15) {
        recommendations.push_back(
            "Many script requests detected - consider script bundling and minification");
    }
}

} // namespace

double response_time_band(double average_ms) {
    if (average_ms < 500.0) {
        return 40.0;
    }
    if (average_ms < 1000.0) {
        return 30.0;
    }
    if (average_ms < 2000.0) {
        return 20.0;
    }
    return 10.0;
}

double calculate_performance_score(double success_rate, double average_ms, double cache_rate) {
    success_rate = std::clamp(success_rate, 0.0, 1.0);
    cache_rate = std::clamp(cache_rate, 0.0, 1.0);
    const double score = success_rate * 40.0 + response_time_band(average_ms) + cache_rate * 20.0;
    return std::clamp(score, 0.0, 100.0);
}

NetworkMonitor::NetworkMonitor(core::DiagnosticEmitter* diagnostics, core::TimeSource clock)
    : diagnostics_(diagnostics),
      clock_(core::or_default_clock(std::move(clock))),
      start_time_(clock_()) {}

std::string NetworkMonitor::mint_request_id(double timestamp) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << timestamp << "-" << ++minted_ids_;
    return oss.str();
}

std::string NetworkMonitor::add_request(const RequestData& data) {
    const double timestamp = data.timestamp.value_or(clock_());
    std::string request_id = (data.request_id && !data.request_id->empty())
                                 ? *data.request_id
                                 : mint_request_id(timestamp);

    auto existing = requests_.find(request_id);
    if (existing != requests_.end()) {
        if (!existing->second.is_pending()) {
            if (diagnostics_) {
                diagnostics_->warning(kModule, "correlate",
                                      "Ignoring request for already finished id: " + request_id);
            }
            return request_id;
        }
        if (diagnostics_) {
            diagnostics_->warning(kModule, "correlate",
                                  "Replacing pending request with duplicate id: " + request_id);
        }
    }

    NetworkRequest request;
    request.request_id = request_id;
    request.url = data.url;
    request.method = data.method;
    request.headers = data.headers;
    request.resource_type = data.resource_type.empty() ? "other" : data.resource_type;
    request.initiator = data.initiator;
    request.post_data = data.post_data;
    request.request_timestamp = timestamp;

    domains_seen_.insert(request.domain());
    resource_types_seen_.insert(request.resource_type);

    if (diagnostics_) {
        diagnostics_->debug(kModule, "ingest",
                            "Added network request: " + request.method + " " + request.url);
    }
    requests_.insert_or_assign(request_id, std::move(request));
    return request_id;
}

NetworkRequest* NetworkMonitor::find_pending(const std::string& request_id, const char* stage) {
    auto it = requests_.find(request_id);
    if (it == requests_.end() || !it->second.is_pending()) {
        if (diagnostics_) {
            diagnostics_->warning(kModule, "correlate",
                                  std::string(stage) + " received for unknown request: " + request_id);
        }
        return nullptr;
    }
    return &it->second;
}

bool NetworkMonitor::add_response(const std::string& request_id, const ResponseData& data) {
    NetworkRequest* request = find_pending(request_id, "Response");
    if (!request) {
        return false;
    }

    request->response_status = data.status;
    request->response_headers = data.headers;
    request->response_timestamp = data.timestamp.value_or(clock_());
    request->size = data.size;
    request->compressed_size = data.compressed_size;
    request->cache_hit = data.from_cache.find("from-cache") != std::string::npos ||
                         data.from_disk_cache || data.from_memory_cache;
    request->from_service_worker = data.from_service_worker;
    if (data.timing && !data.timing->empty()) {
        request->timing = data.timing;
    }
    request->state = RequestState::Completed;
    completion_order_.push_back(request_id);

    if (diagnostics_) {
        const std::string status =
            request->response_status ? std::to_string(*request->response_status) : "none";
        diagnostics_->debug(kModule, "correlate",
                            "Added response for request: " + request->url + " - Status: " + status);
    }
    return true;
}

bool NetworkMonitor::add_request_failure(const std::string& request_id, const std::string& error,
                                         std::optional<std::string> blocked_reason) {
    NetworkRequest* request = find_pending(request_id, "Failure");
    if (!request) {
        return false;
    }

    request->error = error;
    request->blocked_reason = std::move(blocked_reason);
    request->failure_timestamp = clock_();
    request->state = RequestState::Failed;
    completion_order_.push_back(request_id);

    if (diagnostics_) {
        diagnostics_->warning(kModule, "correlate",
                              "Request failed: " + request->url + " - Error: " + error);
    }
    return true;
}

NetworkAnalysis NetworkMonitor::get_analysis() const {
    NetworkAnalysis analysis;
    const auto completed = completed_requests();
    if (completed.empty()) {
        return analysis;
    }

    analysis.total_requests = completed.size();

    std::vector<const NetworkRequest*> timed;
    double total_duration = 0.0;
    for (const NetworkRequest* request : completed) {
        if (request->is_successful()) ++analysis.successful_requests;
        if (request->is_error()) ++analysis.failed_requests;
        if (request->is_blocked()) ++analysis.blocked_requests;
        if (request->cache_hit) ++analysis.cached_requests;

        if (auto duration = request->duration_ms()) {
            total_duration += *duration;
            timed.push_back(request);
        }

        ++analysis.resource_types[request->resource_type];
        ++analysis.domains[request->domain()];
        if (has_reportable_status(*request)) {
            ++analysis.status_codes[*request->response_status];
        }
        if (request->size && *request->size > 0) {
            analysis.total_bytes_transferred += *request->size;
        }
        if (request->compressed_size && *request->compressed_size > 0) {
            analysis.total_bytes_compressed += *request->compressed_size;
        }
    }

    if (!timed.empty()) {
        analysis.average_response_time = total_duration / static_cast<double>(timed.size());
    }

    std::stable_sort(timed.begin(), timed.end(), [](const NetworkRequest* a, const NetworkRequest* b) {
        return *a->duration_ms() > *b->duration_ms();
    });
    const std::size_t ranked = std::min(timed.size(), core::config::kRankedRequestCount);
    for (std::size_t i = 0; i < ranked; ++i) {
        analysis.slowest_requests.push_back(rank_entry(*timed[i]));
        analysis.fastest_requests.push_back(rank_entry(*timed[timed.size() - 1 - i]));
    }

    if (analysis.total_bytes_transferred > 0) {
        const double ratio = 1.0 - static_cast<double>(analysis.total_bytes_compressed) /
                                       static_cast<double>(analysis.total_bytes_transferred);
        analysis.compression_ratio = std::clamp(ratio, 0.0, 1.0);
    }

    analyze_issues(analysis, analysis.issues, analysis.recommendations);

    const double total = static_cast<double>(analysis.total_requests);
    analysis.performance_score = calculate_performance_score(
        static_cast<double>(analysis.successful_requests) / total,
        analysis.average_response_time,
        static_cast<double>(analysis.cached_requests) / total);

    return analysis;
}

std::map<std::string, DomainStats> NetworkMonitor::get_domain_analysis() const {
    std::map<std::string, DomainStats> result;
    std::map<std::string, double> duration_sums;

    for (const NetworkRequest* request : completed_requests()) {
        const std::string domain = request->domain();
        auto& stats = result[domain];
        ++stats.total_requests;

        if (request->is_successful()) {
            ++stats.successful_requests;
        } else if (request->is_error()) {
            ++stats.failed_requests;
        }

        if (request->size && *request->size > 0) {
            stats.total_bytes += *request->size;
        }

        if (auto duration = request->duration_ms()) {
            if (stats.timed_requests == 0) {
                stats.min_response_time = *duration;
                stats.max_response_time = *duration;
            } else {
                stats.min_response_time = std::min(stats.min_response_time, *duration);
                stats.max_response_time = std::max(stats.max_response_time, *duration);
            }
            ++stats.timed_requests;
            duration_sums[domain] += *duration;
        }

        ++stats.resource_types[request->resource_type];
        if (has_reportable_status(*request)) {
            ++stats.status_codes[*request->response_status];
        }
    }

    for (auto& [domain, stats] : result) {
        if (stats.timed_requests > 0) {
            stats.average_response_time =
                duration_sums[domain] / static_cast<double>(stats.timed_requests);
        }
        stats.success_rate = static_cast<double>(stats.successful_requests) /
                             static_cast<double>(stats.total_requests);
    }
    return result;
}

nlohmann::json NetworkMonitor::export_summary() const {
    nlohmann::json summary;
    summary["monitoring_duration"] = clock_() - start_time_;
    summary["analysis"] = get_analysis();
    summary["domain_analysis"] = get_domain_analysis();
    summary["pending_requests"] = pending_count();
    summary["domains_seen"] = domains_seen_.size();
    summary["resource_types_seen"] = resource_types_seen_;

    auto completed = completed_requests();
    std::stable_sort(completed.begin(), completed.end(),
                     [](const NetworkRequest* a, const NetworkRequest* b) {
                         return a->request_timestamp < b->request_timestamp;
                     });
    const std::size_t keep = std::min(completed.size(), core::config::kTimelineLimit);

    nlohmann::json timeline = nlohmann::json::array();
    for (auto it = completed.end() - static_cast<std::ptrdiff_t>(keep); it != completed.end(); ++it) {
        const NetworkRequest& request = **it;
        nlohmann::json entry{
            {"timestamp", request.request_timestamp},
            {"url", request.url},
            {"method", request.method},
        };
        entry["status"] = request.response_status ? nlohmann::json(*request.response_status)
                                                  : nlohmann::json(nullptr);
        auto duration = request.duration_ms();
        entry["duration"] = duration ? nlohmann::json(*duration) : nlohmann::json(nullptr);
        entry["size"] = request.size ? nlohmann::json(*request.size) : nlohmann::json(nullptr);
        entry["error"] = request.error ? nlohmann::json(*request.error) : nlohmann::json(nullptr);
        timeline.push_back(std::move(entry));
    }
    summary["timeline"] = std::move(timeline);
    return summary;
}

const NetworkRequest* NetworkMonitor::find(const std::string& request_id) const {
    auto it = requests_.find(request_id);
    return it == requests_.end() ? nullptr : &it->second;
}

std::vector<const NetworkRequest*> NetworkMonitor::completed_requests() const {
    std::vector<const NetworkRequest*> result;
    result.reserve(completion_order_.size());
    for (const auto& id : completion_order_) {
        result.push_back(&requests_.at(id));
    }
    return result;
}

std::vector<const NetworkRequest*> NetworkMonitor::pending_requests() const {
    std::vector<const NetworkRequest*> result;
    for (const auto& [id, request] : requests_) {
        if (request.is_pending()) {
            result.push_back(&request);
        }
    }
    std::sort(result.begin(), result.end(), [](const NetworkRequest* a, const NetworkRequest* b) {
        return a->request_timestamp < b->request_timestamp;
    });
    return result;
}

std::size_t NetworkMonitor::pending_count() const {
    return static_cast<std::size_t>(std::count_if(
        requests_.begin(), requests_.end(),
        [](const auto& entry) { return entry.second.is_pending(); }));
}

std::size_t NetworkMonitor::completed_count() const {
    return completion_order_.size();
}

const std::set<std::string>& NetworkMonitor::domains_seen() const {
    return domains_seen_;
}

const std::set<std::string>& NetworkMonitor::resource_types_seen() const {
    return resource_types_seen_;
}

double NetworkMonitor::start_time() const {
    return start_time_;
}

void to_json(nlohmann::json& j, const RankedRequest& request) {
    j = nlohmann::json{
        {"url", request.url},
        {"method", request.method},
        {"duration", request.duration_ms},
        {"cache_hit", request.cache_hit},
    };
    j["status"] = request.status ? nlohmann::json(*request.status) : nlohmann::json(nullptr);
    j["size"] = request.size ? nlohmann::json(*request.size) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const NetworkAnalysis& analysis) {
    nlohmann::json status_codes = nlohmann::json::object();
    for (const auto& [status, count] : analysis.status_codes) {
        status_codes[std::to_string(status)] = count;
    }
    j = nlohmann::json{
        {"total_requests", analysis.total_requests},
        {"successful_requests", analysis.successful_requests},
        {"failed_requests", analysis.failed_requests},
        {"blocked_requests", analysis.blocked_requests},
        {"cached_requests", analysis.cached_requests},
        {"average_response_time", analysis.average_response_time},
        {"slowest_requests", analysis.slowest_requests},
        {"fastest_requests", analysis.fastest_requests},
        {"resource_types", analysis.resource_types},
        {"domains", analysis.domains},
        {"status_codes", std::move(status_codes)},
        {"total_bytes_transferred", analysis.total_bytes_transferred},
        {"total_bytes_compressed", analysis.total_bytes_compressed},
        {"compression_ratio", analysis.compression_ratio},
        {"issues", analysis.issues},
        {"recommendations", analysis.recommendations},
        {"performance_score", analysis.performance_score},
    };
}

void to_json(nlohmann::json& j, const DomainStats& stats) {
    nlohmann::json status_codes = nlohmann::json::object();
    for (const auto& [status, count] : stats.status_codes) {
        status_codes[std::to_string(status)] = count;
    }
    j = nlohmann::json{
        {"total_requests", stats.total_requests},
        {"successful_requests", stats.successful_requests},
        {"failed_requests", stats.failed_requests},
        {"total_bytes", stats.total_bytes},
        {"average_response_time", stats.average_response_time},
        {"min_response_time", stats.min_response_time},
        {"max_response_time", stats.max_response_time},
        {"success_rate", stats.success_rate},
        {"resource_types", stats.resource_types},
        {"status_codes", std::move(status_codes)},
    };
}

} // namespace webprobe::net
