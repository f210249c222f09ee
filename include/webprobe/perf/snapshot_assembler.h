#pragma once

#include <webprobe/core/clock.h>
#include <webprobe/core/config.h>
#include <webprobe/core/diagnostics.h>
#include <webprobe/perf/performance_metrics.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <optional>
#include <vector>

namespace webprobe::perf {

// Browser-side source of page timing snapshots. The returned future may
// resolve later (the page computes the values) and carries any
// instrumentation error as an exception. Hand out promise-backed
// futures: a std::async future blocks in its destructor, which defeats
// the assembler's timeout.
class PerformanceSource {
public:
    virtual ~PerformanceSource() = default;
    virtual std::future<nlohmann::json> request_snapshot() = 0;
};

class SnapshotAssembler {
public:
    explicit SnapshotAssembler(PerformanceSource* source,
                               core::DiagnosticEmitter* diagnostics = nullptr,
                               core::TimeSource clock = {},
                               std::chrono::milliseconds timeout = core::config::kSnapshotTimeout);

    // Round-trips to the source without touching stored snapshots. Never
    // throws: a failed or timed-out request yields an all-absent record.
    PerformanceMetrics collect() const;

    // collect() followed by record().
    const PerformanceMetrics& capture();
    void record(PerformanceMetrics metrics);

    const std::vector<PerformanceMetrics>& snapshots() const;
    std::optional<PerformanceMetrics> latest() const;

    void set_source(PerformanceSource* source);

private:
    PerformanceSource* source_;
    core::DiagnosticEmitter* diagnostics_;
    core::TimeSource clock_;
    std::chrono::milliseconds timeout_;
    std::vector<PerformanceMetrics> snapshots_;
};

}  // namespace webprobe::perf
