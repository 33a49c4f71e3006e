#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lightbench/core/Outcome.hpp"
#include "lightbench/infra/Clock.hpp"

namespace lightbench {

struct StatsSnapshot {
    std::string label;
    std::string name;
    uint64_t count = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t bytes_total = 0;

    // Latency in milliseconds over every recorded attempt, failures included.
    double min_ms = 0.0;
    double max_ms = 0.0;
    double mean_ms = 0.0;
    double p50_ms = 0.0;
    double p90_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;

    // Attempts per second between the first start and the last completion.
    double rps = 0.0;

    std::map<ErrorClass, uint64_t> errors;

    double errorRate() const {
        return count ? static_cast<double>(failures) / static_cast<double>(count) : 0.0;
    }

    double avgBytes() const {
        return count ? static_cast<double>(bytes_total) / static_cast<double>(count) : 0.0;
    }
};

// ---------------------------------------------------------------------------
// MetricsSink
//
// Thread-safe aggregation of request outcomes, one slot per protocol label.
// Each slot has its own lock, so labels never contend with each other.
// Latencies go into a bounded reservoir (Algorithm R); counts, bytes,
// min, max and mean stay exact.
// ---------------------------------------------------------------------------
class MetricsSink {
public:
    static constexpr size_t DEFAULT_RESERVOIR = 100000;

    explicit MetricsSink(size_t reservoir = DEFAULT_RESERVOIR, uint64_t seed = 0);

    MetricsSink(const MetricsSink&) = delete;
    MetricsSink& operator=(const MetricsSink&) = delete;

    void record(const RequestOutcome& outcome);

    std::optional<StatsSnapshot> snapshot(const std::string& label) const;
    std::vector<StatsSnapshot> snapshotAll() const;
    std::vector<std::string> labels() const;

    // Nearest-rank percentile of an already sorted sample, p in [0, 1].
    static double percentile(const std::vector<double>& sorted, double p);

private:
    struct Slot {
        mutable std::mutex mtx;
        std::string name;
        uint64_t count = 0;
        uint64_t successes = 0;
        uint64_t bytes = 0;
        double sum_ms = 0.0;
        double min_ms = 0.0;
        double max_ms = 0.0;
        bool have_window = false;
        infra::MonoTime first_start{};
        infra::MonoTime last_end{};
        std::map<ErrorClass, uint64_t> errors;
        std::vector<double> reservoir;
        std::mt19937_64 rng;
    };

    Slot& slotFor(const std::string& label);
    static StatsSnapshot build(const std::string& label, const Slot& slot);

    const size_t capacity_;
    const uint64_t seed_;

    mutable std::shared_mutex table_mtx_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace lightbench
