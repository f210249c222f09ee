#include <webprobe/net/network_request.h>

#include <webprobe/core/text.h>

#include <algorithm>

namespace webprobe::net {
namespace {

nlohmann::json optional_json(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

const char* request_state_name(RequestState state) {
    switch (state) {
        case RequestState::Pending:   return "pending";
        case RequestState::Completed: return "completed";
        case RequestState::Failed:    return "failed";
    }
    return "unknown";
}

bool NetworkTiming::empty() const {
    return !dns_lookup && !tcp_connect && !tls_handshake && !request_sent && !waiting &&
           !content_download && !total_time;
}

std::optional<double> NetworkRequest::duration_ms() const {
    if (state != RequestState::Completed || !response_timestamp) {
        return std::nullopt;
    }
    // Caller-supplied timestamps can be skewed; a response never precedes its request.
    return std::max(0.0, (*response_timestamp - request_timestamp) * 1000.0);
}

bool NetworkRequest::is_successful() const {
    return response_status && *response_status >= 200 && *response_status < 400;
}

bool NetworkRequest::is_error() const {
    return error.has_value() || (response_status && *response_status >= 400);
}

bool NetworkRequest::is_blocked() const {
    return blocked_reason && !blocked_reason->empty();
}

std::string NetworkRequest::domain() const {
    return extract_domain(url);
}

std::string extract_domain(std::string_view url) {
    auto scheme_end = url.find("//");
    if (scheme_end == std::string_view::npos) {
        return "";
    }
    auto authority = url.substr(scheme_end + 2);
    auto end = authority.find_first_of("/?#");
    if (end != std::string_view::npos) {
        authority = authority.substr(0, end);
    }
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    return core::to_lower_ascii(std::string(authority));
}

void to_json(nlohmann::json& j, const NetworkTiming& timing) {
    j = nlohmann::json{
        {"dns_lookup", optional_json(timing.dns_lookup)},
        {"tcp_connect", optional_json(timing.tcp_connect)},
        {"tls_handshake", optional_json(timing.tls_handshake)},
        {"request_sent", optional_json(timing.request_sent)},
        {"waiting", optional_json(timing.waiting)},
        {"content_download", optional_json(timing.content_download)},
        {"total_time", optional_json(timing.total_time)},
    };
}

void to_json(nlohmann::json& j, const NetworkRequest& request) {
    j = nlohmann::json{
        {"request_id", request.request_id},
        {"url", request.url},
        {"method", request.method},
        {"headers", request.headers},
        {"resource_type", request.resource_type},
        {"timestamp", request.request_timestamp},
        {"state", request_state_name(request.state)},
        {"response_headers", request.response_headers},
        {"cache_hit", request.cache_hit},
        {"from_service_worker", request.from_service_worker},
    };
    j["initiator"] = request.initiator ? *request.initiator : nlohmann::json(nullptr);
    j["post_data"] = request.post_data ? nlohmann::json(*request.post_data) : nlohmann::json(nullptr);
    j["status"] = request.response_status ? nlohmann::json(*request.response_status)
                                          : nlohmann::json(nullptr);
    j["response_timestamp"] = optional_json(request.response_timestamp);
    j["duration"] = optional_json(request.duration_ms());
    j["size"] = request.size ? nlohmann::json(*request.size) : nlohmann::json(nullptr);
    j["compressed_size"] = request.compressed_size ? nlohmann::json(*request.compressed_size)
                                                   : nlohmann::json(nullptr);
    j["timing"] = request.timing ? nlohmann::json(*request.timing) : nlohmann::json(nullptr);
    j["error"] = request.error ? nlohmann::json(*request.error) : nlohmann::json(nullptr);
    j["blocked_reason"] = request.blocked_reason ? nlohmann::json(*request.blocked_reason)
                                                 : nlohmann::json(nullptr);
}

} // namespace webprobe::net
