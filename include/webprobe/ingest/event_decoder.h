#pragma once

#include <webprobe/console/console_message.h>
#include <webprobe/net/network_request.h>
#include <webprobe/session/session.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace webprobe::ingest {

// Decoders are tolerant: a field that is missing or has the wrong JSON
// type is treated as absent and the type's default applies.

console::RawConsoleMessage decode_console_message(const nlohmann::json& payload);
session::PageErrorData decode_page_error(const nlohmann::json& payload);
net::RequestData decode_request(const nlohmann::json& payload);

struct ResponseEvent {
    std::string request_id;
    net::ResponseData response;
};

struct FailureEvent {
    std::string request_id;
    std::string error;
    std::optional<std::string> blocked_reason;
};

// nullopt when the payload carries no request_id to correlate on.
std::optional<ResponseEvent> decode_response(const nlohmann::json& payload);
std::optional<FailureEvent> decode_request_failure(const nlohmann::json& payload);

// Routes a {"kind": ..., "payload": {...}} envelope to the matching
// session entry point. Kinds: console, page_error, request, response,
// request_failed, navigation, interaction. Returns false (with a warning
// diagnostic) when the envelope cannot be routed.
bool dispatch(session::Session& session, const nlohmann::json& envelope);

}  // namespace webprobe::ingest
