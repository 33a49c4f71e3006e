#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "lightbench/config/ConfigLoader.hpp"
#include "lightbench/harness/LoadHarness.hpp"

namespace lightbench {

struct HttpTargetSettings {
    bool enabled = true;
    std::string url;
    int weight = 1;
};

struct CoapTargetSettings {
    bool enabled = true;
    std::string host = "localhost";
    uint16_t port = 5683;
    std::string path = "60001";
    int weight = 1;
    std::chrono::milliseconds ack_timeout{2000};
    int max_retransmit = 4;
    std::chrono::milliseconds startup_grace{10000};
};

struct BenchConfig {
    HarnessOptions harness;
    std::chrono::milliseconds timeout{10000};
    int report_interval_s = 0;
    size_t reservoir = 100000;
    std::string csv_prefix;

    HttpTargetSettings jsonrpc{true, "http://localhost:4000/jsonrpc", 1};
    HttpTargetSettings rest{true, "http://localhost:5000/externalLights", 1};
    CoapTargetSettings coap;

    BenchConfig();

    // Later calls override earlier ones. Each throws ConfigError on a value
    // that does not parse.
    void applyIni(const ConfigLoader& ini);
    void applyEnv(const std::function<const char*(const char*)>& getenv_fn);

    // Disables every protocol except the named one.
    void restrictTo(const std::string& protocol);

    // Throws ConfigError on out-of-range values or when nothing is enabled.
    void validate() const;

    void dump() const;
};

enum class Command {
    Run,
    Check,
    Help
};

struct CommandLine {
    Command command = Command::Run;
    std::string check_target;
    std::string config_path;
    std::string only;
    std::vector<std::pair<std::string, std::string>> flags;   // in order given
};

// Throws ConfigError on unknown flags or a flag missing its value.
CommandLine parseCommandLine(const std::vector<std::string>& args);

// Defaults, then INI, then environment, then flags; validated.
BenchConfig resolveConfig(const CommandLine& cli,
                          const std::function<const char*(const char*)>& getenv_fn);

// "30s", "10m", "1h", "1h30m", "250ms" or bare seconds.
std::chrono::milliseconds parseDuration(const std::string& text);

void printUsage(std::ostream& os);

} // namespace lightbench
