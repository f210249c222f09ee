#pragma once
#include <webprobe/core/clock.h>
#include <webprobe/core/diagnostics.h>
#include <webprobe/net/network_request.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace webprobe::net {

struct RankedRequest {
    std::string url;
    std::string method;
    double duration_ms = 0.0;
    std::optional<int> status;
    std::optional<std::int64_t> size;
    bool cache_hit = false;
};

struct NetworkAnalysis {
    std::size_t total_requests = 0;
    std::size_t successful_requests = 0;
    std::size_t failed_requests = 0;
    std::size_t blocked_requests = 0;
    std::size_t cached_requests = 0;

    double average_response_time = 0.0;  // ms, timed requests only
    std::vector<RankedRequest> slowest_requests;  // slowest first
    std::vector<RankedRequest> fastest_requests;  // fastest first

    std::map<std::string, std::size_t> resource_types;
    std::map<std::string, std::size_t> domains;
    std::map<int, std::size_t> status_codes;

    std::int64_t total_bytes_transferred = 0;
    std::int64_t total_bytes_compressed = 0;
    double compression_ratio = 0.0;

    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
    double performance_score = 0.0;
};

struct DomainStats {
    std::size_t total_requests = 0;
    std::size_t successful_requests = 0;
    std::size_t failed_requests = 0;
    std::int64_t total_bytes = 0;
    std::size_t timed_requests = 0;
    double average_response_time = 0.0;
    double min_response_time = 0.0;
    double max_response_time = 0.0;
    double success_rate = 0.0;
    std::map<std::string, std::size_t> resource_types;
    std::map<int, std::size_t> status_codes;
};

// 40 below 500 ms, 30 below 1000 ms, 20 below 2000 ms, otherwise 10.
double response_time_band(double average_ms);

// 40 * success_rate + response_time_band(average_ms) + 20 * cache_rate, in [0, 100].
double calculate_performance_score(double success_rate, double average_ms, double cache_rate);

void to_json(nlohmann::json& j, const RankedRequest& request);
void to_json(nlohmann::json& j, const NetworkAnalysis& analysis);
void to_json(nlohmann::json& j, const DomainStats& stats);

// Correlates request, response and failure signals by request_id.
// Every request lives in one map tagged with its state; completion_order_
// records the order in which requests reached a terminal state.
// Single consumer: callers serialize access.
class NetworkMonitor {
public:
    explicit NetworkMonitor(core::DiagnosticEmitter* diagnostics = nullptr,
                            core::TimeSource clock = {});

    std::string add_request(const RequestData& data);

    // Both return false when the id is unknown or no longer pending; the
    // signal is then dropped with a warning diagnostic.
    bool add_response(const std::string& request_id, const ResponseData& data);
    bool add_request_failure(const std::string& request_id, const std::string& error,
                             std::optional<std::string> blocked_reason = std::nullopt);

    NetworkAnalysis get_analysis() const;
    std::map<std::string, DomainStats> get_domain_analysis() const;
    nlohmann::json export_summary() const;

    const NetworkRequest* find(const std::string& request_id) const;
    // Terminal requests in completion order.
    std::vector<const NetworkRequest*> completed_requests() const;
    std::vector<const NetworkRequest*> pending_requests() const;

    std::size_t pending_count() const;
    std::size_t completed_count() const;
    const std::set<std::string>& domains_seen() const;
    const std::set<std::string>& resource_types_seen() const;
    double start_time() const;

private:
    NetworkRequest* find_pending(const std::string& request_id, const char* stage);
    std::string mint_request_id(double timestamp);

    std::unordered_map<std::string, NetworkRequest> requests_;
    std::vector<std::string> completion_order_;
    std::set<std::string> domains_seen_;
    std::set<std::string> resource_types_seen_;
    std::uint64_t minted_ids_ = 0;
    core::DiagnosticEmitter* diagnostics_;
    core::TimeSource clock_;
    double start_time_;
};

} // namespace webprobe::net
