#pragma once
#include <webprobe/net/header_map.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace webprobe::net {

enum class RequestState {
    Pending,
    Completed,
    Failed,
};

const char* request_state_name(RequestState state);

// Phase durations in milliseconds; a phase the browser did not report is absent.
struct NetworkTiming {
    std::optional<double> dns_lookup;
    std::optional<double> tcp_connect;
    std::optional<double> tls_handshake;
    std::optional<double> request_sent;
    std::optional<double> waiting;
    std::optional<double> content_download;
    std::optional<double> total_time;

    bool empty() const;
};

// Request-started signal. request_id and timestamp are filled by the
// monitor when the instrumentation layer leaves them out.
struct RequestData {
    std::optional<std::string> request_id;
    std::string url;
    std::string method = "GET";
    HeaderMap headers;
    std::string resource_type = "other";
    std::optional<nlohmann::json> initiator;
    std::optional<std::string> post_data;
    std::optional<double> timestamp;
};

struct ResponseData {
    std::optional<int> status;
    HeaderMap headers;
    std::optional<std::int64_t> size;
    std::optional<std::int64_t> compressed_size;
    std::string from_cache;
    bool from_disk_cache = false;
    bool from_memory_cache = false;
    bool from_service_worker = false;
    std::optional<NetworkTiming> timing;
    std::optional<double> timestamp;
};

struct NetworkRequest {
    std::string request_id;
    std::string url;
    std::string method;
    HeaderMap headers;
    std::string resource_type;
    std::optional<nlohmann::json> initiator;
    std::optional<std::string> post_data;
    double request_timestamp = 0.0;

    RequestState state = RequestState::Pending;

    // Completed
    std::optional<int> response_status;
    HeaderMap response_headers;
    std::optional<double> response_timestamp;
    std::optional<std::int64_t> size;
    std::optional<std::int64_t> compressed_size;
    std::optional<NetworkTiming> timing;
    bool cache_hit = false;
    bool from_service_worker = false;

    // Failed
    std::optional<std::string> error;
    std::optional<std::string> blocked_reason;
    std::optional<double> failure_timestamp;

    // Milliseconds between request and response; absent until a response
    // arrives and for failed requests.
    std::optional<double> duration_ms() const;
    bool is_pending() const { return state == RequestState::Pending; }
    bool is_successful() const;
    bool is_error() const;
    bool is_blocked() const;
    std::string domain() const;
};

// URL authority without credentials, e.g. "cdn.example.com:8080".
// Returns an empty string when the URL has no authority.
std::string extract_domain(std::string_view url);

void to_json(nlohmann::json& j, const NetworkTiming& timing);
void to_json(nlohmann::json& j, const NetworkRequest& request);

} // namespace webprobe::net
