#include <webprobe/ingest/event_decoder.h>

#include <webprobe/core/json_number.h>

#include <cstdint>
#include <utility>

namespace webprobe::ingest {
namespace {

constexpr const char* kModule = "ingest";

const nlohmann::json* field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> string_field(const nlohmann::json& object, const char* key) {
    const auto* value = field(object, key);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<double> number_field(const nlohmann::json& object, const char* key) {
    const auto* value = field(object, key);
    if (!value || !value->is_number()) {
        return std::nullopt;
    }
    return value->get<double>();
}

std::optional<std::int64_t> integer_field(const nlohmann::json& object, const char* key) {
    const auto* value = field(object, key);
    if (!value) {
        return std::nullopt;
    }
    return core::json_to_int64(*value);
}

bool bool_field(const nlohmann::json& object, const char* key) {
    const auto* value = field(object, key);
    return value && value->is_boolean() && value->get<bool>();
}

std::optional<int> int_field(const nlohmann::json& object, const char* key, const char* alias) {
    const auto* value = field(object, key);
    if (!value && alias) {
        value = field(object, alias);
    }
    if (!value) {
        return std::nullopt;
    }
    return core::json_to_int(*value);
}

// Header values that are not strings (numbers, booleans) are kept in their
// JSON text form.
net::HeaderMap decode_headers(const nlohmann::json& object) {
    net::HeaderMap headers;
    const auto* value = field(object, "headers");
    if (!value || !value->is_object()) {
        return headers;
    }
    for (const auto& item : value->items()) {
        const std::string& name = item.key();
        const nlohmann::json& entry = item.value();
        if (entry.is_string()) {
            headers.append(name, entry.get<std::string>());
        } else if (entry.is_array()) {
            for (const auto& part : entry) {
                if (part.is_string()) {
                    headers.append(name, part.get<std::string>());
                }
            }
        } else if (!entry.is_null()) {
            headers.append(name, entry.dump());
        }
    }
    return headers;
}

std::optional<console::SourceLocation> decode_location(const nlohmann::json& object) {
    const auto* value = field(object, "location");
    if (!value || !value->is_object()) {
        return std::nullopt;
    }
    console::SourceLocation location;
    location.url = string_field(*value, "url").value_or("");
    location.line = int_field(*value, "line", "lineNumber");
    location.column = int_field(*value, "column", "columnNumber");
    return location;
}

std::optional<net::NetworkTiming> decode_timing(const nlohmann::json& object) {
    const auto* value = field(object, "timing");
    if (!value || !value->is_object()) {
        return std::nullopt;
    }
    net::NetworkTiming timing;
    timing.dns_lookup = number_field(*value, "dns_lookup");
    timing.tcp_connect = number_field(*value, "tcp_connect");
    timing.tls_handshake = number_field(*value, "tls_handshake");
    timing.request_sent = number_field(*value, "request_sent");
    timing.waiting = number_field(*value, "waiting");
    timing.content_download = number_field(*value, "content_download");
    timing.total_time = number_field(*value, "total_time");
    if (timing.empty()) {
        return std::nullopt;
    }
    return timing;
}

}  // namespace

console::RawConsoleMessage decode_console_message(const nlohmann::json& payload) {
    console::RawConsoleMessage message;
    message.text = string_field(payload, "text").value_or("");
    if (auto level = string_field(payload, "level")) {
        message.level = std::move(*level);
    } else if (auto type = string_field(payload, "type")) {
        message.level = std::move(*type);
    }
    message.location = decode_location(payload);
    message.stack_trace = string_field(payload, "stack_trace");
    message.timestamp = number_field(payload, "timestamp");

    if (const auto* args = field(payload, "args"); args && args->is_array()) {
        for (const auto& arg : *args) {
            message.args.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
        }
    }
    return message;
}

session::PageErrorData decode_page_error(const nlohmann::json& payload) {
    session::PageErrorData error;
    error.message = string_field(payload, "message").value_or("");
    error.stack = string_field(payload, "stack");
    error.timestamp = number_field(payload, "timestamp");
    return error;
}

net::RequestData decode_request(const nlohmann::json& payload) {
    net::RequestData request;
    request.request_id = string_field(payload, "request_id");
    request.url = string_field(payload, "url").value_or("");
    if (auto method = string_field(payload, "method"); method && !method->empty()) {
        request.method = std::move(*method);
    }
    request.headers = decode_headers(payload);
    if (auto type = string_field(payload, "resource_type"); type && !type->empty()) {
        request.resource_type = std::move(*type);
    }
    if (const auto* initiator = field(payload, "initiator")) {
        request.initiator = *initiator;
    }
    request.post_data = string_field(payload, "post_data");
    request.timestamp = number_field(payload, "timestamp");
    return request;
}

std::optional<ResponseEvent> decode_response(const nlohmann::json& payload) {
    auto request_id = string_field(payload, "request_id");
    if (!request_id || request_id->empty()) {
        return std::nullopt;
    }

    ResponseEvent event;
    event.request_id = std::move(*request_id);
    auto& response = event.response;
    response.status = int_field(payload, "status", nullptr);
    response.headers = decode_headers(payload);
    response.size = integer_field(payload, "size");
    response.compressed_size = integer_field(payload, "compressed_size");
    response.from_cache = string_field(payload, "from_cache").value_or("");
    response.from_disk_cache = bool_field(payload, "from_disk_cache");
    response.from_memory_cache = bool_field(payload, "from_memory_cache");
    response.from_service_worker = bool_field(payload, "from_service_worker");
    response.timing = decode_timing(payload);
    response.timestamp = number_field(payload, "timestamp");
    return event;
}

std::optional<FailureEvent> decode_request_failure(const nlohmann::json& payload) {
    auto request_id = string_field(payload, "request_id");
    if (!request_id || request_id->empty()) {
        return std::nullopt;
    }
    FailureEvent event;
    event.request_id = std::move(*request_id);
    event.error = string_field(payload, "error").value_or("");
    event.blocked_reason = string_field(payload, "blocked_reason");
    return event;
}

bool dispatch(session::Session& session, const nlohmann::json& envelope) {
    auto& diagnostics = session.diagnostics();
    const auto kind = string_field(envelope, "kind");
    if (!kind) {
        diagnostics.warning(kModule, "dispatch", "Event envelope has no kind");
        return false;
    }
    static const nlohmann::json kEmpty = nlohmann::json::object();
    const auto* payload_field = field(envelope, "payload");
    const nlohmann::json& payload = payload_field ? *payload_field : kEmpty;

    if (*kind == "console") {
        session.on_console_message(decode_console_message(payload));
    } else if (*kind == "page_error") {
        session.on_page_error(decode_page_error(payload));
    } else if (*kind == "request") {
        session.on_request(decode_request(payload));
    } else if (*kind == "response") {
        auto event = decode_response(payload);
        if (!event) {
            diagnostics.warning(kModule, "dispatch", "Response event without request_id");
            return false;
        }
        session.on_response(event->request_id, event->response);
    } else if (*kind == "request_failed") {
        auto event = decode_request_failure(payload);
        if (!event) {
            diagnostics.warning(kModule, "dispatch", "Failure event without request_id");
            return false;
        }
        session.on_request_failed(event->request_id, event->error, std::move(event->blocked_reason));
    } else if (*kind == "navigation") {
        session.on_navigation_complete(string_field(payload, "url").value_or(""));
    } else if (*kind == "interaction") {
        session.on_interaction(payload);
    } else {
        diagnostics.warning(kModule, "dispatch", "Unknown event kind: " + *kind);
        return false;
    }
    return true;
}

}  // namespace webprobe::ingest
