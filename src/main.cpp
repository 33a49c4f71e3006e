#include "lightbench/config/BenchConfig.hpp"
#include "lightbench/core/Errors.hpp"
#include "lightbench/harness/LoadHarness.hpp"
#include "lightbench/metrics/MetricsSink.hpp"
#include "lightbench/protocol/AdapterFactory.hpp"
#include "lightbench/report/Report.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace lightbench;

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
    g_running.store(false);
}

static const char* systemEnv(const char* name) {
    return std::getenv(name);
}

static int runCheck(const BenchConfig& cfg, const std::string& protocol) {
    AdapterPtr adapter;
    try {
        adapter = makeAdapter(protocol, cfg);
    } catch (const BridgeStartupError& e) {
        std::cerr << "[LIGHTBENCH] " << e.what() << "\n";
        return 1;
    }

    RequestOutcome out = adapter->fetch(cfg.harness.vehicle);

    std::cout << "[LIGHTBENCH] " << out.protocol << " " << out.name << " "
              << (out.success ? "OK" : "FAILED") << " in " << out.elapsedMs()
              << "ms, " << out.response_bytes << " bytes\n";
    if (out.error) {
        std::cout << "[LIGHTBENCH] " << errorClassName(*out.error) << ": "
                  << out.detail << "\n";
    }
    if (out.status) {
        std::cout << "[LIGHTBENCH] " << out.status->name << " -> "
                  << statusName(out.status->status) << " ("
                  << statusCode(out.status->status) << ")\n";
    }
    return out.success ? 0 : 1;
}

static int runLoad(const BenchConfig& cfg) {
    std::vector<WeightedAdapter> adapters = buildAdapters(cfg);
    if (adapters.empty()) {
        std::cerr << "[LIGHTBENCH] No protocol adapter could be started\n";
        return 1;
    }

    MetricsSink sink(cfg.reservoir, cfg.harness.seed);
    LoadHarness harness(sink);

    HarnessOptions opts = cfg.harness;
    harness.start(opts, adapters);

    using clock = std::chrono::steady_clock;
    auto next_report = clock::now() + std::chrono::seconds(cfg.report_interval_s);

    while (harness.running()) {
        if (!g_running.load()) {
            std::cout << "[LIGHTBENCH] Interrupted, stopping users\n";
            harness.stop();
            break;
        }
        if (cfg.report_interval_s > 0 && clock::now() >= next_report) {
            Report::writeSummary(std::cout, sink.snapshotAll());
            next_report += std::chrono::seconds(cfg.report_interval_s);
        }
        harness.waitFor(std::chrono::milliseconds(200));
    }
    harness.wait();

    const std::vector<StatsSnapshot> stats = sink.snapshotAll();
    std::cout << "\n";
    Report::writeTable(std::cout, stats);

    if (!cfg.csv_prefix.empty() && !Report::writeCsv(cfg.csv_prefix, stats)) {
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::vector<std::string> args(argv + 1, argv + argc);

    CommandLine cli;
    BenchConfig cfg;
    try {
        cli = parseCommandLine(args);
        if (cli.command == Command::Help) {
            printUsage(std::cout);
            return 0;
        }
        cfg = resolveConfig(cli, systemEnv);
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        printUsage(std::cerr);
        return 2;
    }

    cfg.dump();

    if (cli.command == Command::Check) {
        return runCheck(cfg, cli.check_target);
    }
    return runLoad(cfg);
}
