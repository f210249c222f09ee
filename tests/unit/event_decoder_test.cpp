#include <webprobe/core/json_number.h>
#include <webprobe/ingest/event_decoder.h>

#include <gtest/gtest.h>

using namespace webprobe;
using namespace webprobe::ingest;

// ---------------------------------------------------------------------------
// 1. Console payload
// ---------------------------------------------------------------------------
TEST(EventDecoderTest, DecodeConsoleMessage) {
    auto payload = nlohmann::json::parse(R"({
        "text": "Uncaught TypeError: x is undefined",
        "level": "error",
        "location": {"url": "https://a.com/app.js", "lineNumber": 12, "columnNumber": 4},
        "args": ["x", 3],
        "timestamp": 5.5
    })");
    auto message = decode_console_message(payload);

    EXPECT_EQ(message.text, "Uncaught TypeError: x is undefined");
    EXPECT_EQ(message.level, "error");
    ASSERT_TRUE(message.location.has_value());
    EXPECT_EQ(message.location->url, "https://a.com/app.js");
    EXPECT_EQ(*message.location->line, 12);
    EXPECT_EQ(*message.location->column, 4);
    ASSERT_EQ(message.args.size(), 2u);
    EXPECT_EQ(message.args[1], "3");
    EXPECT_DOUBLE_EQ(*message.timestamp, 5.5);
}

TEST(EventDecoderTest, ConsoleDefaultsForMissingOrWrongTypes) {
    auto message = decode_console_message(nlohmann::json{{"text", 42}, {"location", "nowhere"}});
    EXPECT_EQ(message.text, "");
    EXPECT_EQ(message.level, "info");
    EXPECT_FALSE(message.location.has_value());
    EXPECT_FALSE(message.timestamp.has_value());

    auto from_array = decode_console_message(nlohmann::json::array());
    EXPECT_EQ(from_array.text, "");
}

// ---------------------------------------------------------------------------
// 2. Request payload
// ---------------------------------------------------------------------------
TEST(EventDecoderTest, DecodeRequest) {
    auto payload = nlohmann::json::parse(R"({
        "request_id": "r1",
        "url": "https://a.com/api",
        "method": "POST",
        "headers": {"Content-Type": "application/json", "X-Count": 2},
        "resource_type": "fetch",
        "initiator": {"type": "script"},
        "post_data": "{}"
    })");
    auto request = decode_request(payload);

    EXPECT_EQ(*request.request_id, "r1");
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.resource_type, "fetch");
    EXPECT_EQ(*request.headers.get("content-type"), "application/json");
    EXPECT_EQ(*request.headers.get("x-count"), "2");
    EXPECT_EQ((*request.initiator)["type"], "script");
    EXPECT_EQ(*request.post_data, "{}");
    EXPECT_FALSE(request.timestamp.has_value());
}

TEST(EventDecoderTest, RequestDefaults) {
    auto request = decode_request(nlohmann::json{{"url", "https://a.com/"}, {"method", nullptr}});
    EXPECT_FALSE(request.request_id.has_value());
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.resource_type, "other");
    EXPECT_TRUE(request.headers.empty());
}

// ---------------------------------------------------------------------------
// 3. Response and failure payloads need a request id
// ---------------------------------------------------------------------------
TEST(EventDecoderTest, DecodeResponse) {
    auto payload = nlohmann::json::parse(R"({
        "request_id": "r1",
        "status": 200,
        "size": 2048,
        "compressed_size": 512,
        "from_disk_cache": true,
        "from_service_worker": "yes",
        "timing": {"dns_lookup": 3.5, "waiting": 40}
    })");
    auto event = decode_response(payload);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->request_id, "r1");
    EXPECT_EQ(*event->response.status, 200);
    EXPECT_EQ(*event->response.size, 2048);
    EXPECT_EQ(*event->response.compressed_size, 512);
    EXPECT_TRUE(event->response.from_disk_cache);
    EXPECT_FALSE(event->response.from_service_worker);
    ASSERT_TRUE(event->response.timing.has_value());
    EXPECT_DOUBLE_EQ(*event->response.timing->dns_lookup, 3.5);
    EXPECT_FALSE(event->response.timing->tcp_connect.has_value());
}

TEST(EventDecoderTest, ResponseWithoutIdRejected) {
    EXPECT_FALSE(decode_response(nlohmann::json{{"status", 200}}).has_value());
    EXPECT_FALSE(decode_request_failure(nlohmann::json{{"error", "x"}}).has_value());

    auto failure = decode_request_failure(
        nlohmann::json{{"request_id", "r2"}, {"error", "net::ERR_BLOCKED_BY_CLIENT"},
                       {"blocked_reason", "inspector"}});
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->error, "net::ERR_BLOCKED_BY_CLIENT");
    EXPECT_EQ(*failure->blocked_reason, "inspector");
}

// ---------------------------------------------------------------------------
// 4. Envelope dispatch
// ---------------------------------------------------------------------------
TEST(EventDecoderTest, DispatchRoutesEnvelopes) {
    session::Session session;

    EXPECT_TRUE(dispatch(session, nlohmann::json::parse(R"({
        "kind": "request",
        "payload": {"request_id": "r1", "url": "https://a.com/", "timestamp": 1.0}
    })")));
    EXPECT_TRUE(dispatch(session, nlohmann::json::parse(R"({
        "kind": "response",
        "payload": {"request_id": "r1", "status": 404, "timestamp": 1.2}
    })")));
    EXPECT_TRUE(dispatch(session, nlohmann::json::parse(R"({
        "kind": "page_error",
        "payload": {"message": "Uncaught Error: boom", "stack": "at x"}
    })")));

    auto analysis = session.network_analysis();
    EXPECT_EQ(analysis.total_requests, 1u);
    EXPECT_EQ(analysis.failed_requests, 1u);
    EXPECT_EQ(session.console_analysis().error_count, 1u);
}

TEST(EventDecoderTest, DispatchRejectsUnroutableEnvelopes) {
    session::Session session;

    EXPECT_FALSE(dispatch(session, nlohmann::json{{"payload", {}}}));
    EXPECT_FALSE(dispatch(session, nlohmann::json{{"kind", "teleport"}}));
    EXPECT_FALSE(dispatch(session, nlohmann::json{{"kind", "response"},
                                                  {"payload", {{"status", 200}}}}));

    auto warnings = session.diagnostics().events_by_module("ingest");
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings[1].message, "Unknown event kind: teleport");
    EXPECT_EQ(session.summary().total_events, 0u);
}

// ---------------------------------------------------------------------------
// 5. Numbers outside the target range are treated as absent
// ---------------------------------------------------------------------------
TEST(EventDecoderTest, OutOfRangeNumbersAreAbsent) {
    auto payload = nlohmann::json::parse(R"({
        "request_id": "r1",
        "status": 4294967296,
        "size": 1e20,
        "compressed_size": 18446744073709551615
    })");
    auto event = decode_response(payload);

    ASSERT_TRUE(event.has_value());
    EXPECT_FALSE(event->response.status.has_value());
    EXPECT_FALSE(event->response.size.has_value());
    EXPECT_FALSE(event->response.compressed_size.has_value());

    auto in_range = decode_response(nlohmann::json::parse(
        R"({"request_id": "r2", "status": 200.0, "size": 9007199254740992})"));
    ASSERT_TRUE(in_range.has_value());
    EXPECT_EQ(*in_range->response.status, 200);
    EXPECT_EQ(*in_range->response.size, 9007199254740992LL);
}

TEST(EventDecoderTest, JsonIntegerConversion) {
    EXPECT_EQ(*core::json_to_int64(nlohmann::json(-42)), -42);
    EXPECT_EQ(*core::json_to_int64(nlohmann::json(12.9)), 12);
    EXPECT_FALSE(core::json_to_int64(nlohmann::json(9.3e18)).has_value());
    EXPECT_FALSE(core::json_to_int64(nlohmann::json(-1e19)).has_value());
    EXPECT_FALSE(core::json_to_int64(nlohmann::json("12")).has_value());
    EXPECT_FALSE(core::json_to_int(nlohmann::json(3000000000LL)).has_value());
    EXPECT_EQ(*core::json_to_int(nlohmann::json(-7)), -7);
}
