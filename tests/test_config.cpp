#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include "lightbench/config/BenchConfig.hpp"
#include "lightbench/core/Errors.hpp"

using namespace lightbench;
using namespace std::chrono_literals;

namespace {

struct FakeEnv {
    std::map<std::string, std::string> vars;

    std::function<const char*(const char*)> fn() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

struct TempIni {
    explicit TempIni(const std::string& text) {
        path = std::filesystem::temp_directory_path() /
               ("lightbench_test_" + std::to_string(++counter) + ".ini");
        std::ofstream out(path);
        out << text;
    }
    ~TempIni() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    std::filesystem::path path;
    static inline int counter = 0;
};

}

TEST_CASE("defaults match the documented configuration", "[config]") {
    BenchConfig cfg;
    CHECK(cfg.harness.vehicle == "roadrunner");
    CHECK(cfg.harness.users == 10);
    CHECK(cfg.harness.spawn_rate == 2.0);
    CHECK(cfg.harness.duration == 60000ms);
    CHECK(cfg.harness.think_min == 10ms);
    CHECK(cfg.harness.think_max == 50ms);
    CHECK(cfg.timeout == 10000ms);
    CHECK(cfg.jsonrpc.url == "http://localhost:4000/jsonrpc");
    CHECK(cfg.rest.url == "http://localhost:5000/externalLights");
    CHECK(cfg.coap.host == "localhost");
    CHECK(cfg.coap.port == 5683);
    CHECK(cfg.coap.path == "60001");
    CHECK(cfg.coap.ack_timeout == 2000ms);
    CHECK(cfg.coap.max_retransmit == 4);
    CHECK(cfg.jsonrpc.enabled);
    CHECK(cfg.rest.enabled);
    CHECK(cfg.coap.enabled);
    CHECK_NOTHROW(cfg.validate());
}

TEST_CASE("ini parser", "[config]") {
    std::istringstream in(
        "# comment\n"
        "; another\n"
        "[harness]\n"
        "  users = 25  \n"
        "vehicle=coyote\n"
        "\n"
        "[coap]\n"
        "enabled = off\n");
    ConfigLoader ini;
    ini.parse(in);

    CHECK(ini.size() == 3);
    CHECK(ini.get("harness", "vehicle") == "coyote");
    CHECK(ini.getInt("harness", "users") == 25);
    CHECK(ini.getBool("coap", "enabled", true) == false);
    CHECK(ini.getInt("harness", "missing", 9) == 9);
    CHECK_FALSE(ini.has("rest", "url"));
}

TEST_CASE("ini syntax and value errors", "[config]") {
    ConfigLoader ini;
    std::istringstream no_eq("[harness]\nusers 5\n");
    CHECK_THROWS_AS(ini.parse(no_eq), ConfigError);

    std::istringstream open_section("[harness\n");
    CHECK_THROWS_AS(ConfigLoader().parse(open_section), ConfigError);

    ConfigLoader bad;
    bad.set("harness", "users", "ten");
    CHECK_THROWS_AS(bad.getInt("harness", "users"), ConfigError);
    bad.set("jsonrpc", "enabled", "maybe");
    CHECK_THROWS_AS(bad.getBool("jsonrpc", "enabled"), ConfigError);
}

TEST_CASE("durations", "[config]") {
    CHECK(parseDuration("30s") == 30000ms);
    CHECK(parseDuration("10m") == 600000ms);
    CHECK(parseDuration("1h") == 3600000ms);
    CHECK(parseDuration("1h30m") == 5400000ms);
    CHECK(parseDuration("250ms") == 250ms);
    CHECK(parseDuration("45") == 45000ms);
    CHECK(parseDuration("0") == 0ms);

    CHECK_THROWS_AS(parseDuration(""), ConfigError);
    CHECK_THROWS_AS(parseDuration("abc"), ConfigError);
    CHECK_THROWS_AS(parseDuration("10x"), ConfigError);
    CHECK_THROWS_AS(parseDuration("-5s"), ConfigError);
}

TEST_CASE("environment overrides defaults", "[config]") {
    FakeEnv env;
    env.vars = {
        {"CAR_NAME", "coyote"},
        {"JSONRPC_URL", "http://10.0.0.1:4000/jsonrpc"},
        {"REST_URL", "http://10.0.0.1:5000/externalLights"},
        {"COAP_HOST", "10.0.0.1"},
        {"COAP_PORT", "5684"},
        {"ENABLE_REST", "0"},
        {"COAP_WEIGHT", "3"},
        {"LIGHTBENCH_USERS", "40"},
        {"LIGHTBENCH_DURATION", "2m"},
    };

    BenchConfig cfg;
    cfg.applyEnv(env.fn());

    CHECK(cfg.harness.vehicle == "coyote");
    CHECK(cfg.jsonrpc.url == "http://10.0.0.1:4000/jsonrpc");
    CHECK(cfg.rest.url == "http://10.0.0.1:5000/externalLights");
    CHECK(cfg.coap.host == "10.0.0.1");
    CHECK(cfg.coap.port == 5684);
    CHECK_FALSE(cfg.rest.enabled);
    CHECK(cfg.coap.weight == 3);
    CHECK(cfg.harness.users == 40);
    CHECK(cfg.harness.duration == 120000ms);
}

TEST_CASE("FETCH_SID is the fallback for the CoAP path", "[config]") {
    FakeEnv env;
    env.vars = {{"FETCH_SID", "60002"}};
    BenchConfig cfg;
    cfg.applyEnv(env.fn());
    CHECK(cfg.coap.path == "60002");

    env.vars["COAP_PATH"] = "status/60003";
    cfg.applyEnv(env.fn());
    CHECK(cfg.coap.path == "status/60003");
}

TEST_CASE("invalid environment values are config errors", "[config]") {
    BenchConfig cfg;
    FakeEnv env;

    env.vars = {{"COAP_PORT", "70000"}};
    CHECK_THROWS_AS(cfg.applyEnv(env.fn()), ConfigError);

    env.vars = {{"LIGHTBENCH_USERS", "many"}};
    CHECK_THROWS_AS(cfg.applyEnv(env.fn()), ConfigError);

    env.vars = {{"ENABLE_COAP", "perhaps"}};
    CHECK_THROWS_AS(cfg.applyEnv(env.fn()), ConfigError);
}

TEST_CASE("command line parsing", "[config]") {
    CommandLine cli = parseCommandLine({"run", "-u", "5", "-r", "1.5", "-t", "30s",
                                        "--vehicle", "wile", "--csv", "out/run1",
                                        "--only", "coap"});
    CHECK(cli.command == Command::Run);
    CHECK(cli.only == "coap");
    CHECK(cli.flags.size() == 5);

    CommandLine check = parseCommandLine({"check", "rest"});
    CHECK(check.command == Command::Check);
    CHECK(check.check_target == "rest");

    CHECK(parseCommandLine({"--help"}).command == Command::Help);
    CHECK(parseCommandLine({}).command == Command::Run);

    CHECK_THROWS_AS(parseCommandLine({"-u"}), ConfigError);
    CHECK_THROWS_AS(parseCommandLine({"--frobnicate"}), ConfigError);
    CHECK_THROWS_AS(parseCommandLine({"launch"}), ConfigError);
    CHECK_THROWS_AS(parseCommandLine({"check"}), ConfigError);
}

TEST_CASE("layers apply in order: ini, environment, flags", "[config]") {
    TempIni ini(
        "[harness]\n"
        "users = 20\n"
        "spawn_rate = 4\n"
        "vehicle = from-ini\n"
        "[rest]\n"
        "url = http://ini-host/externalLights\n"
        "weight = 2\n");

    FakeEnv env;
    env.vars = {{"LIGHTBENCH_USERS", "30"}, {"CAR_NAME", "from-env"}};

    CommandLine cli = parseCommandLine({"--config", ini.path.string(), "-u", "50"});
    BenchConfig cfg = resolveConfig(cli, env.fn());

    CHECK(cfg.harness.users == 50);                 // flag
    CHECK(cfg.harness.vehicle == "from-env");       // env over ini
    CHECK(cfg.harness.spawn_rate == 4.0);           // ini
    CHECK(cfg.rest.url == "http://ini-host/externalLights");
    CHECK(cfg.rest.weight == 2);
}

TEST_CASE("--only and check restrict the protocols", "[config]") {
    FakeEnv env;
    TempIni empty("");

    BenchConfig only = resolveConfig(
        parseCommandLine({"--config", empty.path.string(), "--only", "rest"}), env.fn());
    CHECK(only.rest.enabled);
    CHECK_FALSE(only.jsonrpc.enabled);
    CHECK_FALSE(only.coap.enabled);

    BenchConfig check = resolveConfig(
        parseCommandLine({"check", "coap", "--config", empty.path.string()}), env.fn());
    CHECK(check.coap.enabled);
    CHECK_FALSE(check.rest.enabled);

    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", empty.path.string(),
                                                    "--only", "mqtt"}),
                                  env.fn()),
                    ConfigError);
}

TEST_CASE("validation catches unusable settings", "[config]") {
    FakeEnv env;
    TempIni empty("");
    const std::string path = empty.path.string();

    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", path, "-u", "0"}), env.fn()),
                    ConfigError);
    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", path, "-r", "0"}), env.fn()),
                    ConfigError);
    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", path, "-r", "nan"}), env.fn()),
                    ConfigError);
    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", path, "-r", "inf"}), env.fn()),
                    ConfigError);

    env.vars = {{"ENABLE_JSONRPC", "0"}, {"ENABLE_REST", "0"}, {"ENABLE_COAP", "0"}};
    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", path}), env.fn()),
                    ConfigError);

    CHECK_THROWS_AS(resolveConfig(parseCommandLine({"--config", "/nonexistent/lb.ini"}),
                                  FakeEnv().fn()),
                    ConfigError);
}
