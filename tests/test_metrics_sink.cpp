#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "lightbench/metrics/MetricsSink.hpp"

using namespace lightbench;
using namespace std::chrono_literals;

namespace {

RequestOutcome okOutcome(const std::string& label, double ms, uint64_t bytes,
                         infra::MonoTime start = infra::now()) {
    auto elapsed = std::chrono::duration_cast<infra::MonoDur>(
        std::chrono::duration<double, std::milli>(ms));
    return RequestOutcome::ok(label, "fetch", start, elapsed, bytes);
}

RequestOutcome failedOutcome(const std::string& label, ErrorClass e, double ms = 1.0) {
    auto elapsed = std::chrono::duration_cast<infra::MonoDur>(
        std::chrono::duration<double, std::milli>(ms));
    return RequestOutcome::failed(label, "fetch", infra::now(), elapsed, 0, e, "stub");
}

}

TEST_CASE("nearest-rank percentiles", "[metrics]") {
    std::vector<double> v;
    for (int i = 1; i <= 100; ++i) v.push_back(i);

    CHECK(MetricsSink::percentile(v, 0.50) == 50.0);
    CHECK(MetricsSink::percentile(v, 0.90) == 90.0);
    CHECK(MetricsSink::percentile(v, 0.99) == 99.0);
    CHECK(MetricsSink::percentile(v, 1.00) == 100.0);
    CHECK(MetricsSink::percentile(v, 0.0) == 1.0);
    CHECK(MetricsSink::percentile({}, 0.5) == 0.0);
    CHECK(MetricsSink::percentile({7.0}, 0.99) == 7.0);
}

TEST_CASE("snapshot aggregates counts, bytes and latency", "[metrics]") {
    MetricsSink sink;
    for (int i = 1; i <= 100; ++i) {
        sink.record(okOutcome("JSONRPC", i, 10));
    }
    sink.record(failedOutcome("JSONRPC", ErrorClass::Timeout, 1000.0));
    sink.record(failedOutcome("JSONRPC", ErrorClass::ProtocolError));

    auto snap = sink.snapshot("JSONRPC");
    REQUIRE(snap);
    CHECK(snap->label == "JSONRPC");
    CHECK(snap->name == "fetch");
    CHECK(snap->count == 102);
    CHECK(snap->successes == 100);
    CHECK(snap->failures == 2);
    CHECK(snap->count == snap->successes + snap->failures);
    CHECK(snap->bytes_total == 1000);
    CHECK(snap->min_ms == Approx(1.0));
    CHECK(snap->max_ms == Approx(1000.0));
    CHECK(snap->p50_ms == Approx(50.0));
    CHECK(snap->errorRate() == Approx(2.0 / 102.0));
    CHECK(snap->errors.at(ErrorClass::Timeout) == 1);
    CHECK(snap->errors.at(ErrorClass::ProtocolError) == 1);
    CHECK(snap->errors.count(ErrorClass::DecodeError) == 0);
}

TEST_CASE("unknown label has no snapshot", "[metrics]") {
    MetricsSink sink;
    CHECK_FALSE(sink.snapshot("COAP"));
    CHECK(sink.labels().empty());
}

TEST_CASE("labels are kept apart", "[metrics]") {
    MetricsSink sink;
    sink.record(okOutcome("COAP", 5.0, 20));
    sink.record(okOutcome("REST", 50.0, 200));
    sink.record(okOutcome("REST", 60.0, 200));

    CHECK(sink.labels() == std::vector<std::string>{"COAP", "REST"});
    CHECK(sink.snapshot("COAP")->count == 1);
    CHECK(sink.snapshot("REST")->count == 2);
    CHECK(sink.snapshot("COAP")->p99_ms == Approx(5.0));

    auto all = sink.snapshotAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].label == "COAP");
    CHECK(all[1].bytes_total == 400);
}

TEST_CASE("requests per second spans first start to last end", "[metrics]") {
    MetricsSink sink;
    const auto t0 = infra::now();
    for (int i = 0; i < 10; ++i) {
        // Ten 10ms requests back to back over 100ms.
        sink.record(okOutcome("COAP", 10.0, 1, t0 + std::chrono::milliseconds(10 * i)));
    }
    auto snap = sink.snapshot("COAP");
    REQUIRE(snap);
    CHECK(snap->rps == Approx(100.0).epsilon(0.01));
}

TEST_CASE("reservoir stays bounded while counts stay exact", "[metrics]") {
    MetricsSink sink(64, 1);
    for (int i = 0; i < 10000; ++i) {
        sink.record(okOutcome("JSONRPC", 5.0, 1));
    }
    auto snap = sink.snapshot("JSONRPC");
    REQUIRE(snap);
    CHECK(snap->count == 10000);
    CHECK(snap->p50_ms == Approx(5.0));
    CHECK(snap->mean_ms == Approx(5.0));
}

TEST_CASE("concurrent record and snapshot stay consistent", "[metrics][concurrency]") {
    MetricsSink sink;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!done.load()) {
            for (const auto& s : sink.snapshotAll()) {
                if (s.count != s.successes + s.failures) ++torn;
                uint64_t err_total = 0;
                for (const auto& e : s.errors) err_total += e.second;
                if (err_total != s.failures) ++torn;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t] {
            const std::string label = (t % 2) ? "COAP" : "JSONRPC";
            for (int i = 0; i < 5000; ++i) {
                if (i % 5 == 0) {
                    sink.record(failedOutcome(label, ErrorClass::TransportError));
                } else {
                    sink.record(okOutcome(label, 2.0, 3));
                }
            }
        });
    }
    for (auto& w : writers) w.join();
    done = true;
    reader.join();

    CHECK(torn.load() == 0);
    auto coap = sink.snapshot("COAP");
    REQUIRE(coap);
    CHECK(coap->count == 10000);
    CHECK(coap->failures == 2000);
    CHECK(coap->bytes_total == 8000 * 3);
}
