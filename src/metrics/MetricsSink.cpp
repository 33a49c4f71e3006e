#include "lightbench/metrics/MetricsSink.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace lightbench {

MetricsSink::MetricsSink(size_t reservoir, uint64_t seed)
    : capacity_(reservoir == 0 ? 1 : reservoir), seed_(seed) {}

MetricsSink::Slot& MetricsSink::slotFor(const std::string& label) {
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        auto it = slots_.find(label);
        if (it != slots_.end()) return *it->second;
    }
    std::unique_lock<std::shared_mutex> lock(table_mtx_);
    auto& slot = slots_[label];
    if (!slot) {
        slot = std::make_unique<Slot>();
        slot->rng.seed(seed_ ^ std::hash<std::string>{}(label));
        slot->reservoir.reserve(std::min<size_t>(capacity_, 4096));
    }
    return *slot;
}

void MetricsSink::record(const RequestOutcome& o) {
    Slot& s = slotFor(o.protocol);
    const double ms = o.elapsedMs();
    const infra::MonoTime end = o.start + o.elapsed;

    std::lock_guard<std::mutex> lock(s.mtx);

    if (s.name.empty()) s.name = o.name;

    ++s.count;
    if (o.success) {
        ++s.successes;
    } else {
        ++s.errors[o.failureClass()];
    }
    s.bytes += o.response_bytes;
    s.sum_ms += ms;

    if (s.count == 1) {
        s.min_ms = s.max_ms = ms;
    } else {
        s.min_ms = std::min(s.min_ms, ms);
        s.max_ms = std::max(s.max_ms, ms);
    }

    if (!s.have_window) {
        s.first_start = o.start;
        s.last_end = end;
        s.have_window = true;
    } else {
        if (o.start < s.first_start) s.first_start = o.start;
        if (end > s.last_end) s.last_end = end;
    }

    if (s.reservoir.size() < capacity_) {
        s.reservoir.push_back(ms);
    } else {
        std::uniform_int_distribution<uint64_t> pick(0, s.count - 1);
        const uint64_t j = pick(s.rng);
        if (j < capacity_) s.reservoir[j] = ms;
    }
}

double MetricsSink::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const long n = static_cast<long>(sorted.size());
    long idx = static_cast<long>(std::ceil(p * n)) - 1;
    if (idx < 0) idx = 0;
    if (idx >= n) idx = n - 1;
    return sorted[idx];
}

StatsSnapshot MetricsSink::build(const std::string& label, const Slot& s) {
    StatsSnapshot snap;
    snap.label = label;
    snap.name = s.name;
    snap.count = s.count;
    snap.successes = s.successes;
    snap.failures = s.count - s.successes;
    snap.bytes_total = s.bytes;
    snap.errors = s.errors;

    if (s.count == 0) return snap;

    snap.min_ms = s.min_ms;
    snap.max_ms = s.max_ms;
    snap.mean_ms = s.sum_ms / static_cast<double>(s.count);

    std::vector<double> tmp = s.reservoir;
    std::sort(tmp.begin(), tmp.end());
    snap.p50_ms = percentile(tmp, 0.50);
    snap.p90_ms = percentile(tmp, 0.90);
    snap.p95_ms = percentile(tmp, 0.95);
    snap.p99_ms = percentile(tmp, 0.99);

    const double window_s =
        std::chrono::duration<double>(s.last_end - s.first_start).count();
    snap.rps = window_s > 0.0 ? static_cast<double>(s.count) / window_s : 0.0;
    return snap;
}

std::optional<StatsSnapshot> MetricsSink::snapshot(const std::string& label) const {
    const Slot* slot = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        auto it = slots_.find(label);
        if (it == slots_.end()) return std::nullopt;
        slot = it->second.get();
    }
    std::lock_guard<std::mutex> lock(slot->mtx);
    return build(label, *slot);
}

std::vector<std::string> MetricsSink::labels() const {
    std::shared_lock<std::shared_mutex> lock(table_mtx_);
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto& kv : slots_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<StatsSnapshot> MetricsSink::snapshotAll() const {
    std::vector<StatsSnapshot> out;
    for (const std::string& label : labels()) {
        if (auto snap = snapshot(label)) out.push_back(std::move(*snap));
    }
    return out;
}

} // namespace lightbench
