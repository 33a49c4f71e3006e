#include "lightbench/config/BenchConfig.hpp"
#include "lightbench/core/Errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <iostream>

namespace lightbench {

using std::chrono::milliseconds;

BenchConfig::BenchConfig() {
    harness.duration = milliseconds(60000);
}

milliseconds parseDuration(const std::string& text) {
    if (text.empty()) throw ConfigError("duration: empty value");

    long long total_ms = 0;
    size_t i = 0;
    bool any = false;
    while (i < text.size()) {
        size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        if (i == start) throw ConfigError("duration: cannot parse '" + text + "'");
        const long long n = parseIntValue("duration", text.substr(start, i - start));

        std::string unit;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
            unit += text[i++];
        }
        if (unit.empty() || unit == "s") {
            total_ms += n * 1000;
        } else if (unit == "ms") {
            total_ms += n;
        } else if (unit == "m") {
            total_ms += n * 60 * 1000;
        } else if (unit == "h") {
            total_ms += n * 3600 * 1000;
        } else {
            throw ConfigError("duration: unknown unit '" + unit + "' in '" + text + "'");
        }
        any = true;
        if (unit.empty() && i < text.size()) {
            throw ConfigError("duration: cannot parse '" + text + "'");
        }
    }
    if (!any) throw ConfigError("duration: cannot parse '" + text + "'");
    return milliseconds(total_ms);
}

static int toInt(const std::string& what, const std::string& v) {
    const long long n = parseIntValue(what, v);
    if (n < INT32_MIN || n > INT32_MAX) throw ConfigError(what + ": out of range");
    return static_cast<int>(n);
}

static uint16_t toPort(const std::string& what, const std::string& v) {
    const long long n = parseIntValue(what, v);
    if (n < 1 || n > 65535) throw ConfigError(what + ": port out of range '" + v + "'");
    return static_cast<uint16_t>(n);
}

static uint64_t toSeed(const std::string& what, const std::string& v) {
    const long long n = parseIntValue(what, v);
    if (n < 0) throw ConfigError(what + ": must not be negative");
    return static_cast<uint64_t>(n);
}

void BenchConfig::applyIni(const ConfigLoader& ini) {
    if (ini.has("harness", "vehicle"))    harness.vehicle = ini.get("harness", "vehicle");
    if (ini.has("harness", "users"))      harness.users = toInt("harness.users", ini.get("harness", "users"));
    if (ini.has("harness", "spawn_rate")) harness.spawn_rate = ini.getDouble("harness", "spawn_rate");
    if (ini.has("harness", "duration"))   harness.duration = parseDuration(ini.get("harness", "duration"));
    if (ini.has("harness", "think_min_ms"))
        harness.think_min = milliseconds(ini.getInt("harness", "think_min_ms"));
    if (ini.has("harness", "think_max_ms"))
        harness.think_max = milliseconds(ini.getInt("harness", "think_max_ms"));
    if (ini.has("harness", "timeout_ms")) timeout = milliseconds(ini.getInt("harness", "timeout_ms"));
    if (ini.has("harness", "seed"))       harness.seed = toSeed("harness.seed", ini.get("harness", "seed"));
    if (ini.has("harness", "report_interval_s"))
        report_interval_s = toInt("harness.report_interval_s", ini.get("harness", "report_interval_s"));

    if (ini.has("metrics", "reservoir")) {
        const long long n = ini.getInt("metrics", "reservoir");
        if (n <= 0) throw ConfigError("metrics.reservoir: must be positive");
        reservoir = static_cast<size_t>(n);
    }
    if (ini.has("report", "csv_prefix")) csv_prefix = ini.get("report", "csv_prefix");

    jsonrpc.enabled = ini.getBool("jsonrpc", "enabled", jsonrpc.enabled);
    jsonrpc.url = ini.get("jsonrpc", "url", jsonrpc.url);
    if (ini.has("jsonrpc", "weight")) jsonrpc.weight = toInt("jsonrpc.weight", ini.get("jsonrpc", "weight"));

    rest.enabled = ini.getBool("rest", "enabled", rest.enabled);
    rest.url = ini.get("rest", "url", rest.url);
    if (ini.has("rest", "weight")) rest.weight = toInt("rest.weight", ini.get("rest", "weight"));

    coap.enabled = ini.getBool("coap", "enabled", coap.enabled);
    coap.host = ini.get("coap", "host", coap.host);
    if (ini.has("coap", "port")) coap.port = toPort("coap.port", ini.get("coap", "port"));
    coap.path = ini.get("coap", "path", coap.path);
    if (ini.has("coap", "weight")) coap.weight = toInt("coap.weight", ini.get("coap", "weight"));
    if (ini.has("coap", "ack_timeout_ms"))
        coap.ack_timeout = milliseconds(ini.getInt("coap", "ack_timeout_ms"));
    if (ini.has("coap", "max_retransmit"))
        coap.max_retransmit = toInt("coap.max_retransmit", ini.get("coap", "max_retransmit"));
    if (ini.has("coap", "startup_grace_ms"))
        coap.startup_grace = milliseconds(ini.getInt("coap", "startup_grace_ms"));
}

void BenchConfig::applyEnv(const std::function<const char*(const char*)>& getenv_fn) {
    auto env = [&](const char* name) -> const char* {
        const char* v = getenv_fn(name);
        return (v && *v) ? v : nullptr;
    };

    if (const char* v = env("CAR_NAME"))              harness.vehicle = v;
    if (const char* v = env("LIGHTBENCH_USERS"))      harness.users = toInt("LIGHTBENCH_USERS", v);
    if (const char* v = env("LIGHTBENCH_SPAWN_RATE")) harness.spawn_rate = parseDoubleValue("LIGHTBENCH_SPAWN_RATE", v);
    if (const char* v = env("LIGHTBENCH_DURATION"))   harness.duration = parseDuration(v);
    if (const char* v = env("LIGHTBENCH_THINK_MIN_MS"))
        harness.think_min = milliseconds(parseIntValue("LIGHTBENCH_THINK_MIN_MS", v));
    if (const char* v = env("LIGHTBENCH_THINK_MAX_MS"))
        harness.think_max = milliseconds(parseIntValue("LIGHTBENCH_THINK_MAX_MS", v));
    if (const char* v = env("LIGHTBENCH_TIMEOUT_MS"))
        timeout = milliseconds(parseIntValue("LIGHTBENCH_TIMEOUT_MS", v));
    if (const char* v = env("LIGHTBENCH_SEED"))       harness.seed = toSeed("LIGHTBENCH_SEED", v);
    if (const char* v = env("LIGHTBENCH_REPORT_INTERVAL"))
        report_interval_s = toInt("LIGHTBENCH_REPORT_INTERVAL", v);
    if (const char* v = env("LIGHTBENCH_RESERVOIR")) {
        const long long n = parseIntValue("LIGHTBENCH_RESERVOIR", v);
        if (n <= 0) throw ConfigError("LIGHTBENCH_RESERVOIR: must be positive");
        reservoir = static_cast<size_t>(n);
    }
    if (const char* v = env("LIGHTBENCH_CSV"))        csv_prefix = v;

    if (const char* v = env("ENABLE_JSONRPC")) jsonrpc.enabled = parseBoolValue("ENABLE_JSONRPC", v);
    if (const char* v = env("JSONRPC_URL"))    jsonrpc.url = v;
    if (const char* v = env("JSONRPC_WEIGHT")) jsonrpc.weight = toInt("JSONRPC_WEIGHT", v);

    if (const char* v = env("ENABLE_REST")) rest.enabled = parseBoolValue("ENABLE_REST", v);
    if (const char* v = env("REST_URL"))    rest.url = v;
    if (const char* v = env("REST_WEIGHT")) rest.weight = toInt("REST_WEIGHT", v);

    if (const char* v = env("ENABLE_COAP")) coap.enabled = parseBoolValue("ENABLE_COAP", v);
    if (const char* v = env("COAP_HOST"))   coap.host = v;
    if (const char* v = env("COAP_PORT"))   coap.port = toPort("COAP_PORT", v);
    if (const char* v = env("COAP_PATH")) {
        coap.path = v;
    } else if (const char* sid = env("FETCH_SID")) {
        coap.path = sid;
    }
    if (const char* v = env("COAP_WEIGHT")) coap.weight = toInt("COAP_WEIGHT", v);
}

void BenchConfig::restrictTo(const std::string& protocol) {
    if (protocol != "jsonrpc" && protocol != "rest" && protocol != "coap") {
        throw ConfigError("unknown protocol '" + protocol +
                          "' (expected jsonrpc, rest or coap)");
    }
    jsonrpc.enabled = protocol == "jsonrpc";
    rest.enabled = protocol == "rest";
    coap.enabled = protocol == "coap";
}

void BenchConfig::validate() const {
    if (harness.users <= 0) throw ConfigError("users: must be positive");
    if (!(harness.spawn_rate > 0.0) || !std::isfinite(harness.spawn_rate)) {
        throw ConfigError("spawn_rate: must be a positive number");
    }
    if (harness.duration.count() < 0) throw ConfigError("duration: must not be negative");
    if (harness.think_min.count() < 0 || harness.think_max < harness.think_min) {
        throw ConfigError("think time: need 0 <= think_min_ms <= think_max_ms");
    }
    if (timeout.count() <= 0) throw ConfigError("timeout_ms: must be positive");
    if (report_interval_s < 0) throw ConfigError("report_interval_s: must not be negative");
    if (harness.vehicle.empty()) throw ConfigError("vehicle: must not be empty");

    if (jsonrpc.weight < 0 || rest.weight < 0 || coap.weight < 0) {
        throw ConfigError("protocol weights must not be negative");
    }
    if (coap.ack_timeout.count() <= 0) throw ConfigError("coap.ack_timeout_ms: must be positive");
    if (coap.max_retransmit < 0) throw ConfigError("coap.max_retransmit: must not be negative");
    if (coap.startup_grace.count() <= 0) throw ConfigError("coap.startup_grace_ms: must be positive");

    const bool any = (jsonrpc.enabled && jsonrpc.weight > 0) ||
                     (rest.enabled && rest.weight > 0) ||
                     (coap.enabled && coap.weight > 0);
    if (!any) throw ConfigError("no protocol enabled");
}

void BenchConfig::dump() const {
    std::cout << "[CONFIG] vehicle=" << harness.vehicle
              << " users=" << harness.users
              << " spawn_rate=" << harness.spawn_rate
              << " duration=" << harness.duration.count() << "ms"
              << " think=" << harness.think_min.count() << "-" << harness.think_max.count() << "ms"
              << " timeout=" << timeout.count() << "ms\n";
    if (jsonrpc.enabled)
        std::cout << "[CONFIG] JSONRPC " << jsonrpc.url << " weight=" << jsonrpc.weight << "\n";
    if (rest.enabled)
        std::cout << "[CONFIG] REST    " << rest.url << " weight=" << rest.weight << "\n";
    if (coap.enabled)
        std::cout << "[CONFIG] COAP    coap://" << coap.host << ":" << coap.port
                  << "/" << coap.path << " weight=" << coap.weight << "\n";
}

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cli;
    size_t i = 0;

    if (i < args.size() && !args[i].empty() && args[i][0] != '-') {
        if (args[i] == "run") {
            cli.command = Command::Run;
        } else if (args[i] == "check") {
            cli.command = Command::Check;
            if (i + 1 >= args.size()) throw ConfigError("check: missing protocol");
            cli.check_target = args[++i];
        } else if (args[i] == "help") {
            cli.command = Command::Help;
        } else {
            throw ConfigError("unknown command '" + args[i] + "'");
        }
        ++i;
    }

    auto value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= args.size()) throw ConfigError(flag + ": missing value");
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-h" || a == "--help") {
            cli.command = Command::Help;
        } else if (a == "--config" || a == "-c") {
            cli.config_path = value(a);
        } else if (a == "--only") {
            cli.only = value(a);
        } else if (a == "-u" || a == "--users") {
            cli.flags.emplace_back("users", value(a));
        } else if (a == "-r" || a == "--spawn-rate") {
            cli.flags.emplace_back("spawn_rate", value(a));
        } else if (a == "-t" || a == "--run-time") {
            cli.flags.emplace_back("duration", value(a));
        } else if (a == "--vehicle") {
            cli.flags.emplace_back("vehicle", value(a));
        } else if (a == "--csv") {
            cli.flags.emplace_back("csv", value(a));
        } else if (a == "--timeout-ms") {
            cli.flags.emplace_back("timeout_ms", value(a));
        } else if (a == "--seed") {
            cli.flags.emplace_back("seed", value(a));
        } else {
            throw ConfigError("unknown option '" + a + "'");
        }
    }
    return cli;
}

BenchConfig resolveConfig(const CommandLine& cli,
                          const std::function<const char*(const char*)>& getenv_fn) {
    BenchConfig cfg;

    ConfigLoader ini;
    if (!cli.config_path.empty()) {
        ini.loadFile(cli.config_path);
    } else {
        ini.load("lightbench.ini");
    }
    cfg.applyIni(ini);
    cfg.applyEnv(getenv_fn);

    for (const auto& kv : cli.flags) {
        const std::string& key = kv.first;
        const std::string& v = kv.second;
        if (key == "users") {
            cfg.harness.users = toInt("--users", v);
        } else if (key == "spawn_rate") {
            cfg.harness.spawn_rate = parseDoubleValue("--spawn-rate", v);
        } else if (key == "duration") {
            cfg.harness.duration = parseDuration(v);
        } else if (key == "vehicle") {
            cfg.harness.vehicle = v;
        } else if (key == "csv") {
            cfg.csv_prefix = v;
        } else if (key == "timeout_ms") {
            cfg.timeout = milliseconds(parseIntValue("--timeout-ms", v));
        } else if (key == "seed") {
            cfg.harness.seed = toSeed("--seed", v);
        }
    }

    if (cli.command == Command::Check) {
        cfg.restrictTo(cli.check_target);
    } else if (!cli.only.empty()) {
        cfg.restrictTo(cli.only);
    }

    cfg.validate();
    return cfg;
}

void printUsage(std::ostream& os) {
    os << "Usage:\n"
       << "  lightbench [run] [options]       run the load test\n"
       << "  lightbench check <jsonrpc|rest|coap> [options]\n"
       << "                                   send one request and print the result\n"
       << "\n"
       << "Options:\n"
       << "  -c, --config <file>    INI file (default: lightbench.ini if present)\n"
       << "  -u, --users <n>        virtual users (default 10)\n"
       << "  -r, --spawn-rate <n>   users started per second (default 2)\n"
       << "  -t, --run-time <dur>   e.g. 30s, 10m, 1h; 0 = until interrupted (default 60s)\n"
       << "      --vehicle <name>   vehicle name sent in each request (default roadrunner)\n"
       << "      --only <proto>     run a single protocol\n"
       << "      --csv <prefix>     write <prefix>_stats.csv and <prefix>_failures.csv\n"
       << "      --timeout-ms <n>   per-request timeout (default 10000)\n"
       << "      --seed <n>         think-time seed (default random)\n"
       << "  -h, --help\n"
       << "\n"
       << "Environment: CAR_NAME, JSONRPC_URL, REST_URL, COAP_HOST, COAP_PORT, COAP_PATH,\n"
       << "  ENABLE_JSONRPC, ENABLE_REST, ENABLE_COAP, *_WEIGHT, LIGHTBENCH_*\n";
}

} // namespace lightbench
