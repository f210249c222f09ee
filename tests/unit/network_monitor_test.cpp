#include <webprobe/net/network_monitor.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace webprobe;
using namespace webprobe::net;

namespace {

RequestData request(const std::string& id, const std::string& url,
                    const std::string& resource_type = "xhr", double timestamp = 0.0) {
    RequestData data;
    data.request_id = id;
    data.url = url;
    data.resource_type = resource_type;
    data.timestamp = timestamp;
    return data;
}

ResponseData response(int status, double timestamp) {
    ResponseData data;
    data.status = status;
    data.timestamp = timestamp;
    return data;
}

bool contains_prefix(const std::vector<std::string>& items, const std::string& prefix) {
    return std::any_of(items.begin(), items.end(),
                       [&](const std::string& item) { return item.rfind(prefix, 0) == 0; });
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. Pending requests drain as responses arrive
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, PendingDrainsAfterResponses) {
    NetworkMonitor monitor;
    for (int i = 0; i < 3; ++i) {
        monitor.add_request(request("r" + std::to_string(i), "https://a.com/" + std::to_string(i)));
    }
    EXPECT_EQ(monitor.pending_count(), 3u);

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(monitor.add_response("r" + std::to_string(i), response(200, 0.1)));
    }
    EXPECT_EQ(monitor.pending_count(), 0u);
    EXPECT_EQ(monitor.completed_count(), 3u);
}

// ---------------------------------------------------------------------------
// 2. Responses for unknown ids change nothing
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, UnknownResponseIsNoOp) {
    core::DiagnosticEmitter diagnostics;
    NetworkMonitor monitor(&diagnostics);
    monitor.add_request(request("r1", "https://a.com/x"));

    EXPECT_FALSE(monitor.add_response("nope", response(200, 1.0)));
    EXPECT_FALSE(monitor.add_request_failure("nope", "net::ERR_FAILED"));
    EXPECT_EQ(monitor.pending_count(), 1u);
    EXPECT_EQ(monitor.completed_count(), 0u);

    auto warnings = diagnostics.events_by_severity(core::Severity::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].message, "Response received for unknown request: nope");
    EXPECT_EQ(warnings[1].message, "Failure received for unknown request: nope");
}

// ---------------------------------------------------------------------------
// 3. A response after completion is treated as unknown
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, SecondResponseIgnored) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://a.com/x"));
    EXPECT_TRUE(monitor.add_response("r1", response(200, 0.5)));
    EXPECT_FALSE(monitor.add_response("r1", response(500, 0.9)));

    ASSERT_NE(monitor.find("r1"), nullptr);
    EXPECT_EQ(*monitor.find("r1")->response_status, 200);
}

// ---------------------------------------------------------------------------
// 4. Request failure scenario
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, RequestFailureScenario) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://a.com/x", "script"));
    EXPECT_TRUE(monitor.add_request_failure("r1", "net::ERR_FAILED"));

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.failed_requests, 1u);
    EXPECT_EQ(analysis.successful_requests, 0u);
    EXPECT_EQ(monitor.pending_count(), 0u);

    const auto* failed = monitor.find("r1");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->state, RequestState::Failed);
    EXPECT_FALSE(failed->duration_ms().has_value());
    EXPECT_FALSE(failed->is_blocked());
}

// ---------------------------------------------------------------------------
// 5. Blocked failures are counted
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, BlockedFailure) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://ads.example.com/pixel", "image"));
    monitor.add_request_failure("r1", "net::ERR_BLOCKED_BY_CLIENT", std::string("adblock"));

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.blocked_requests, 1u);
    EXPECT_EQ(analysis.failed_requests, 1u);
}

// ---------------------------------------------------------------------------
// 6. Exactly 10% failures does not raise the failure-rate issue
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, FailureRateBoundaryIsExclusive) {
    NetworkMonitor monitor;
    for (int i = 0; i < 10; ++i) {
        const std::string id = "r" + std::to_string(i);
        monitor.add_request(request(id, "https://a.com/" + id, "xhr", 0.0));
        monitor.add_response(id, response(i == 0 ? 500 : 200, 0.1));
    }

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.failed_requests, 1u);
    EXPECT_FALSE(contains_prefix(analysis.issues, "High network failure rate"));
    EXPECT_TRUE(contains_prefix(analysis.issues, "Server errors detected: 1"));

    monitor.add_request(request("r10", "https://a.com/r10", "xhr", 0.0));
    monitor.add_request_failure("r10", "net::ERR_FAILED");
    EXPECT_TRUE(contains_prefix(monitor.get_analysis().issues, "High network failure rate"));
}

// ---------------------------------------------------------------------------
// 7. Empty monitor yields a zero-value analysis
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, EmptyAnalysisIsZero) {
    NetworkMonitor monitor;
    monitor.add_request(request("pending", "https://a.com/"));

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.total_requests, 0u);
    EXPECT_DOUBLE_EQ(analysis.average_response_time, 0.0);
    EXPECT_DOUBLE_EQ(analysis.compression_ratio, 0.0);
    EXPECT_DOUBLE_EQ(analysis.performance_score, 0.0);
    EXPECT_TRUE(analysis.slowest_requests.empty());
    EXPECT_TRUE(monitor.get_domain_analysis().empty());
}

// ---------------------------------------------------------------------------
// 8. Compression ratio
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, CompressionRatio) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://a.com/app.js", "script"));
    auto data = response(200, 0.1);
    data.size = 1000;
    data.compressed_size = 250;
    monitor.add_response("r1", data);

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.total_bytes_transferred, 1000);
    EXPECT_EQ(analysis.total_bytes_compressed, 250);
    EXPECT_DOUBLE_EQ(analysis.compression_ratio, 0.75);
}

TEST(NetworkMonitorTest, CompressionRatioStaysInRange) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://a.com/a", "fetch"));
    auto data = response(200, 0.1);
    data.size = 100;
    data.compressed_size = 400;
    monitor.add_response("r1", data);
    EXPECT_DOUBLE_EQ(monitor.get_analysis().compression_ratio, 0.0);

    NetworkMonitor unsized;
    unsized.add_request(request("r1", "https://a.com/b", "fetch"));
    auto no_size = response(204, 0.1);
    no_size.compressed_size = 50;
    unsized.add_response("r1", no_size);
    EXPECT_DOUBLE_EQ(unsized.get_analysis().compression_ratio, 0.0);
}

// ---------------------------------------------------------------------------
// 9. Ideal request set scores exactly 100
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, IdealSetScoresHundred) {
    NetworkMonitor monitor;
    for (int i = 0; i < 4; ++i) {
        const std::string id = "r" + std::to_string(i);
        monitor.add_request(request(id, "https://a.com/" + id, "image", 1.0));
        auto data = response(200, 1.1);
        data.from_memory_cache = true;
        monitor.add_response(id, data);
    }

    auto analysis = monitor.get_analysis();
    EXPECT_EQ(analysis.cached_requests, 4u);
    EXPECT_NEAR(analysis.average_response_time, 100.0, 1e-6);
    EXPECT_DOUBLE_EQ(analysis.performance_score, 100.0);
    EXPECT_TRUE(analysis.issues.empty());
}

// ---------------------------------------------------------------------------
// 10. Score bands and bounds
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, ScoreBandsAndBounds) {
    EXPECT_DOUBLE_EQ(response_time_band(499.9), 40.0);
    EXPECT_DOUBLE_EQ(response_time_band(500.0), 30.0);
    EXPECT_DOUBLE_EQ(response_time_band(1999.0), 20.0);
    EXPECT_DOUBLE_EQ(response_time_band(2000.0), 10.0);

    EXPECT_DOUBLE_EQ(calculate_performance_score(0.0, 5000.0, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(calculate_performance_score(1.0, 0.0, 1.0), 100.0);
    EXPECT_DOUBLE_EQ(calculate_performance_score(2.0, 0.0, 3.0), 100.0);
    EXPECT_DOUBLE_EQ(calculate_performance_score(0.5, 750.0, 0.5), 60.0);
}

// ---------------------------------------------------------------------------
// 11. Slow average raises an issue; ranked lists exclude pending requests
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, SlowestAndFastestRanking) {
    NetworkMonitor monitor;
    for (int i = 0; i < 7; ++i) {
        const std::string id = "r" + std::to_string(i);
        monitor.add_request(request(id, "https://a.com/" + id, "xhr", 0.0));
        monitor.add_response(id, response(200, 1.0 + i));
    }
    monitor.add_request(request("pending", "https://a.com/pending", "xhr", 0.0));

    auto analysis = monitor.get_analysis();
    ASSERT_EQ(analysis.slowest_requests.size(), 5u);
    ASSERT_EQ(analysis.fastest_requests.size(), 5u);
    EXPECT_EQ(analysis.slowest_requests.front().url, "https://a.com/r6");
    EXPECT_DOUBLE_EQ(analysis.slowest_requests.front().duration_ms, 7000.0);
    EXPECT_EQ(analysis.fastest_requests.front().url, "https://a.com/r0");
    EXPECT_DOUBLE_EQ(analysis.average_response_time, 4000.0);
    EXPECT_TRUE(contains_prefix(analysis.issues, "Slow average response time: 4000ms"));
}

// ---------------------------------------------------------------------------
// 12. Domain analysis
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, DomainAnalysis) {
    NetworkMonitor monitor;
    monitor.add_request(request("a1", "https://user:pw@CDN.Example.com:8080/x.js", "script", 0.0));
    monitor.add_response("a1", response(200, 0.2));
    monitor.add_request(request("a2", "https://cdn.example.com:8080/y.js", "script", 0.0));
    monitor.add_response("a2", response(404, 0.4));
    monitor.add_request(request("b1", "https://api.example.com/v1", "xhr", 0.0));
    monitor.add_request_failure("b1", "net::ERR_TIMED_OUT");

    auto domains = monitor.get_domain_analysis();
    ASSERT_EQ(domains.size(), 2u);

    const auto& cdn = domains.at("cdn.example.com:8080");
    EXPECT_EQ(cdn.total_requests, 2u);
    EXPECT_EQ(cdn.successful_requests, 1u);
    EXPECT_EQ(cdn.failed_requests, 1u);
    EXPECT_NEAR(cdn.average_response_time, 300.0, 1e-6);
    EXPECT_NEAR(cdn.min_response_time, 200.0, 1e-6);
    EXPECT_NEAR(cdn.max_response_time, 400.0, 1e-6);
    EXPECT_DOUBLE_EQ(cdn.success_rate, 0.5);
    EXPECT_EQ(cdn.status_codes.at(404), 1u);

    const auto& api = domains.at("api.example.com");
    EXPECT_EQ(api.failed_requests, 1u);
    EXPECT_EQ(api.timed_requests, 0u);
    EXPECT_DOUBLE_EQ(api.average_response_time, 0.0);
}

// ---------------------------------------------------------------------------
// 13. Export totals agree with the analyses
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, ExportMatchesAnalysis) {
    NetworkMonitor monitor;
    for (int i = 0; i < 25; ++i) {
        const std::string id = "r" + std::to_string(i);
        const std::string host = i % 2 ? "https://a.com/" : "https://b.com/";
        monitor.add_request(request(id, host + id, i % 3 ? "image" : "script", i));
        monitor.add_response(id, response(i % 5 ? 200 : 503, i + 0.05));
    }
    monitor.add_request(request("open", "https://c.com/", "xhr", 30.0));

    auto analysis = monitor.get_analysis();
    auto domains = monitor.get_domain_analysis();
    auto summary = monitor.export_summary();

    EXPECT_EQ(summary["analysis"]["total_requests"], analysis.total_requests);
    EXPECT_EQ(summary["analysis"]["failed_requests"], analysis.failed_requests);
    EXPECT_EQ(summary["analysis"]["status_codes"]["503"], 5);
    EXPECT_EQ(summary["domain_analysis"].size(), domains.size());
    EXPECT_EQ(summary["domain_analysis"]["a.com"]["total_requests"],
              domains.at("a.com").total_requests);
    EXPECT_EQ(summary["pending_requests"], 1);
    EXPECT_EQ(summary["domains_seen"], 3);
    EXPECT_EQ(summary["timeline"].size(), 20u);
    EXPECT_EQ(summary["timeline"].back()["url"], "https://b.com/r24");
}

// ---------------------------------------------------------------------------
// 14. Minted ids, duplicates and header/cache handling
// ---------------------------------------------------------------------------
TEST(NetworkMonitorTest, MintsIdWhenMissing) {
    double now = 12.0;
    NetworkMonitor monitor(nullptr, [&now]() { return now; });
    RequestData data;
    data.url = "https://a.com/";
    auto first = monitor.add_request(data);
    auto second = monitor.add_request(data);

    EXPECT_FALSE(first.empty());
    EXPECT_NE(first, second);
    EXPECT_EQ(monitor.pending_count(), 2u);
    EXPECT_DOUBLE_EQ(monitor.find(first)->request_timestamp, 12.0);
    EXPECT_EQ(monitor.find(first)->method, "GET");
    EXPECT_EQ(monitor.find(first)->resource_type, "other");
}

TEST(NetworkMonitorTest, DuplicatePendingIdReplaced) {
    core::DiagnosticEmitter diagnostics;
    NetworkMonitor monitor(&diagnostics);
    monitor.add_request(request("r1", "https://a.com/old"));
    monitor.add_request(request("r1", "https://a.com/new"));

    EXPECT_EQ(monitor.pending_count(), 1u);
    EXPECT_EQ(monitor.find("r1")->url, "https://a.com/new");
    EXPECT_EQ(diagnostics.events_by_severity(core::Severity::Warning).size(), 1u);
}

TEST(NetworkMonitorTest, ResponseDetailsStored) {
    NetworkMonitor monitor;
    monitor.add_request(request("r1", "https://a.com/x", "stylesheet", 2.0));
    auto data = response(304, 1.5);
    data.headers = HeaderMap{{"Cache-Control", "max-age=60"}, {"Set-Cookie", "a=1"},
                             {"set-cookie", "b=2"}};
    data.from_cache = "from-cache";
    data.timing = NetworkTiming{};
    data.timing->dns_lookup = 12.0;
    monitor.add_response("r1", data);

    const auto* stored = monitor.find("r1");
    ASSERT_NE(stored, nullptr);
    EXPECT_TRUE(stored->cache_hit);
    EXPECT_TRUE(stored->is_successful());
    // Response timestamp before the request clamps to zero.
    EXPECT_DOUBLE_EQ(*stored->duration_ms(), 0.0);
    ASSERT_TRUE(stored->timing.has_value());
    EXPECT_DOUBLE_EQ(*stored->timing->dns_lookup, 12.0);

    EXPECT_EQ(stored->response_headers.size(), 3u);
    EXPECT_EQ(*stored->response_headers.get("CACHE-CONTROL"), "max-age=60");
    EXPECT_EQ(*stored->response_headers.get("Set-Cookie"), "a=1");
    EXPECT_FALSE(stored->response_headers.get("etag").has_value());
    EXPECT_TRUE(stored->headers.empty());

    nlohmann::json j = *stored;
    EXPECT_EQ(j["response_headers"]["set-cookie"], "a=1, b=2");
    EXPECT_EQ(j["state"], "completed");
}

// ---------------------------------------------------------------------------
// 15. Threshold rules for issues and recommendations
// ---------------------------------------------------------------------------
namespace {

// Adds `count` completed requests, each taking `duration_s` seconds.
void add_completed(NetworkMonitor& monitor, int count, const std::string& resource_type,
                   int status = 200, double duration_s = 0.1,
                   const std::string& prefix = "https://a.com/") {
    static int next_id = 0;
    for (int i = 0; i < count; ++i) {
        const std::string id = "t" + std::to_string(next_id++);
        monitor.add_request(request(id, prefix + id, resource_type, 0.0));
        monitor.add_response(id, response(status, duration_s));
    }
}

}  // namespace

TEST(NetworkMonitorTest, ClientErrorsRaiseIssue) {
    NetworkMonitor monitor;
    add_completed(monitor, 9, "xhr");
    EXPECT_FALSE(contains_prefix(monitor.get_analysis().issues, "Client errors detected"));

    add_completed(monitor, 1, "xhr", 404);
    auto analysis = monitor.get_analysis();
    EXPECT_TRUE(contains_prefix(analysis.issues, "Client errors detected: 1"));
    EXPECT_TRUE(contains_prefix(analysis.recommendations, "Review client-side requests"));
}

TEST(NetworkMonitorTest, DomainCountBoundary) {
    NetworkMonitor monitor;
    for (int d = 0; d < 10; ++d) {
        add_completed(monitor, 1, "xhr", 200, 0.1, "https://host" + std::to_string(d) + ".com/");
    }
    EXPECT_EQ(monitor.get_analysis().domains.size(), 10u);
    EXPECT_FALSE(contains_prefix(monitor.get_analysis().issues, "High number of domains"));

    add_completed(monitor, 1, "xhr", 200, 0.1, "https://host10.com/");
    EXPECT_TRUE(contains_prefix(monitor.get_analysis().issues, "High number of domains: 11"));
}

TEST(NetworkMonitorTest, ImageCountBoundary) {
    const std::string advice = "Many image requests detected";
    NetworkMonitor monitor;
    add_completed(monitor, 20, "image");
    EXPECT_FALSE(contains_prefix(monitor.get_analysis().recommendations, advice));

    add_completed(monitor, 1, "image");
    EXPECT_TRUE(contains_prefix(monitor.get_analysis().recommendations, advice));
}

TEST(NetworkMonitorTest, ScriptCountBoundary) {
    const std::string advice = "Many script requests detected";
    NetworkMonitor monitor;
    add_completed(monitor, 15, "script");
    EXPECT_FALSE(contains_prefix(monitor.get_analysis().recommendations, advice));

    add_completed(monitor, 1, "script");
    EXPECT_TRUE(contains_prefix(monitor.get_analysis().recommendations, advice));
}

TEST(NetworkMonitorTest, RequestVolumeBoundary) {
    const std::string advice = "High request volume detected";
    NetworkMonitor monitor;
    add_completed(monitor, 100, "fetch");
    EXPECT_FALSE(contains_prefix(monitor.get_analysis().recommendations, advice));

    add_completed(monitor, 1, "fetch");
    EXPECT_TRUE(contains_prefix(monitor.get_analysis().recommendations, advice));
}

TEST(NetworkMonitorTest, ModeratelySlowAverageIsSoftRecommendation) {
    NetworkMonitor monitor;
    add_completed(monitor, 4, "xhr", 200, 1.5);

    auto analysis = monitor.get_analysis();
    EXPECT_NEAR(analysis.average_response_time, 1500.0, 1e-6);
    EXPECT_FALSE(contains_prefix(analysis.issues, "Slow average response time"));
    EXPECT_TRUE(contains_prefix(analysis.recommendations,
                                "Consider optimizing response times for better user experience"));
    EXPECT_DOUBLE_EQ(analysis.performance_score, 40.0 + 20.0);
}
