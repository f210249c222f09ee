#include <webprobe/perf/snapshot_assembler.h>

#include <exception>
#include <string>
#include <utility>

namespace webprobe::perf {
namespace {

constexpr const char* kModule = "perf";

}  // namespace

SnapshotAssembler::SnapshotAssembler(PerformanceSource* source,
                                     core::DiagnosticEmitter* diagnostics,
                                     core::TimeSource clock,
                                     std::chrono::milliseconds timeout)
    : source_(source),
      diagnostics_(diagnostics),
      clock_(core::or_default_clock(std::move(clock))),
      timeout_(timeout) {}

PerformanceMetrics SnapshotAssembler::collect() const {
    auto fail = [this](const std::string& reason) {
        if (diagnostics_) {
            diagnostics_->error(kModule, "capture",
                                "Failed to collect performance metrics: " + reason);
        }
        PerformanceMetrics empty;
        empty.timestamp = clock_();
        return empty;
    };

    if (!source_) {
        return fail("no performance source attached");
    }

    nlohmann::json payload;
    try {
        std::future<nlohmann::json> pending = source_->request_snapshot();
        if (!pending.valid()) {
            return fail("source returned no snapshot");
        }
        if (pending.wait_for(timeout_) != std::future_status::ready) {
            return fail("timed out after " + std::to_string(timeout_.count()) + "ms");
        }
        payload = pending.get();
    } catch (const std::exception& e) {
        return fail(e.what());
    }

    PerformanceMetrics metrics = parse_performance_snapshot(payload, clock_());
    if (diagnostics_) {
        if (!payload.is_object()) {
            diagnostics_->warning(kModule, "capture", "Snapshot payload is not an object");
        } else {
            diagnostics_->debug(kModule, "capture", "Collected performance snapshot");
        }
    }
    return metrics;
}

const PerformanceMetrics& SnapshotAssembler::capture() {
    record(collect());
    return snapshots_.back();
}

void SnapshotAssembler::record(PerformanceMetrics metrics) {
    snapshots_.push_back(std::move(metrics));
}

const std::vector<PerformanceMetrics>& SnapshotAssembler::snapshots() const {
    return snapshots_;
}

std::optional<PerformanceMetrics> SnapshotAssembler::latest() const {
    if (snapshots_.empty()) {
        return std::nullopt;
    }
    return snapshots_.back();
}

void SnapshotAssembler::set_source(PerformanceSource* source) {
    source_ = source;
}

}  // namespace webprobe::perf
