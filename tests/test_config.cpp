#include <catch2/catch.hpp>
#include "config.hpp"
#include "planner_session.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace stepstream;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.base_url == "http://127.0.0.1:3001");
    REQUIRE(cfg.auth.token.empty());
    REQUIRE(cfg.stream.reconnect_base_ms == 1000);
    REQUIRE(cfg.stream.reconnect_max_ms == 15000);
    REQUIRE(cfg.stream.max_attempts == 0);
    REQUIRE(cfg.stream.stop_on_completion);
    REQUIRE(cfg.replay.page_limit == 200);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "base_url": "https://planner.example.com",
        "auth": {"token": "tok", "device_id": "dev-1", "timezone": "Europe/Helsinki"},
        "stream": {"reconnect_base_ms": 250, "reconnect_max_ms": 4000,
                   "max_attempts": 5, "connect_timeout": 10,
                   "stop_on_completion": false},
        "replay": {"page_limit": 50}
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.base_url == "https://planner.example.com");
    REQUIRE(cfg.auth.token == "tok");
    REQUIRE(cfg.auth.device_id == "dev-1");
    REQUIRE(cfg.auth.timezone == "Europe/Helsinki");
    REQUIRE(cfg.stream.reconnect_base_ms == 250);
    REQUIRE(cfg.stream.reconnect_max_ms == 4000);
    REQUIRE(cfg.stream.max_attempts == 5);
    REQUIRE(cfg.stream.connect_timeout == 10);
    REQUIRE_FALSE(cfg.stream.stop_on_completion);
    REQUIRE(cfg.replay.page_limit == 50);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "base_url": 42,
        "stream": {"reconnect_base_ms": "fast", "max_attempts": -3},
        "replay": {"page_limit": 0}
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.base_url == "http://127.0.0.1:3001");
    REQUIRE(cfg.stream.reconnect_base_ms == 1000);
    REQUIRE(cfg.stream.max_attempts == 0);
    REQUIRE(cfg.replay.page_limit == 200);
}

TEST_CASE("Config::from_json: max delay never below base delay", "[config]") {
    nlohmann::json j = {{"stream", {{"reconnect_base_ms", 5000}, {"reconnect_max_ms", 100}}}};
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.stream.reconnect_max_ms == 5000);
}

TEST_CASE("PlannerSessionOptions::from_config: maps stream and auth settings", "[config]") {
    Config cfg;
    cfg.base_url = "http://planner:9000";
    cfg.auth.token = "abc";
    cfg.stream.reconnect_base_ms = 200;
    cfg.stream.reconnect_max_ms = 800;
    cfg.stream.max_attempts = 4;
    cfg.stream.stop_on_completion = false;

    auto options = PlannerSessionOptions::from_config(cfg);
    REQUIRE(options.base_url == "http://planner:9000");
    REQUIRE(options.reconnect.base_delay == std::chrono::milliseconds(200));
    REQUIRE(options.reconnect.max_delay == std::chrono::milliseconds(800));
    REQUIRE(options.reconnect.max_attempts == 4);
    REQUIRE_FALSE(options.stop_on_completion);
    REQUIRE(options.context_headers.size() == 1);
    REQUIRE(options.context_headers[0].first == "Authorization");
    REQUIRE(options.context_headers[0].second == "Bearer abc");
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "stepstream_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("STEPSTREAM_BASE_URL");
        unsetenv("STEPSTREAM_TOKEN");
        unsetenv("STEPSTREAM_DEVICE_ID");
        unsetenv("STEPSTREAM_TIMEZONE");
        unsetenv("TZ");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.stepstream/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.stepstream");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "base_url": "http://planner.local:8080",
        "auth": {"token": "file-token", "device_id": "file-device"},
        "stream": {"reconnect_base_ms": 500}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://planner.local:8080");
    REQUIRE(cfg.auth.token == "file-token");
    REQUIRE(cfg.auth.device_id == "file-device");
    REQUIRE(cfg.stream.reconnect_base_ms == 500);
    REQUIRE(cfg.stream.reconnect_max_ms == 15000);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://from-file", "auth": {"token": "from-file"}})");
    setenv("STEPSTREAM_BASE_URL", "http://from-env", 1);
    setenv("STEPSTREAM_TOKEN", "from-env", 1);
    setenv("STEPSTREAM_DEVICE_ID", "env-device", 1);
    setenv("STEPSTREAM_TIMEZONE", "America/New_York", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://from-env");
    REQUIRE(cfg.auth.token == "from-env");
    REQUIRE(cfg.auth.device_id == "env-device");
    REQUIRE(cfg.auth.timezone == "America/New_York");

    unsetenv("STEPSTREAM_BASE_URL");
    unsetenv("STEPSTREAM_TOKEN");
    unsetenv("STEPSTREAM_DEVICE_ID");
    unsetenv("STEPSTREAM_TIMEZONE");
}

TEST_CASE("Config::load: TZ fills an unset timezone", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("TZ", "Asia/Tokyo", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.auth.timezone == "Asia/Tokyo");
    unsetenv("TZ");
}

TEST_CASE("Config::load: TZ does not override a configured timezone", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"auth": {"timezone": "Europe/Paris"}})");
    setenv("TZ", "Asia/Tokyo", 1);
    Config cfg = Config::load();
    REQUIRE(cfg.auth.timezone == "Europe/Paris");
    unsetenv("TZ");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://127.0.0.1:3001");
    REQUIRE(cfg.auth.token.empty());
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["base_url"] == "http://127.0.0.1:3001");
    REQUIRE(j["stream"]["reconnect_base_ms"] == 1000);
    REQUIRE(j["stream"]["stop_on_completion"] == true);
    REQUIRE(j["replay"]["page_limit"] == 200);
    REQUIRE(j["auth"]["token"] == "");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://custom", "stream": {"max_attempts": 3}})");

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://custom");
    REQUIRE(cfg.stream.max_attempts == 3);

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["base_url"] == "http://custom");
    REQUIRE(j["stream"]["max_attempts"] == 3);
    REQUIRE(j["stream"]["reconnect_max_ms"] == 15000);
    REQUIRE(j.contains("auth"));
    REQUIRE(j.contains("replay"));
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["base_url"] = "http://kept";
    full["stream"]["max_attempts"] = 7;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://kept");
    REQUIRE(cfg.stream.max_attempts == 7);
    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();
    Config::load();
    REQUIRE(g.read_config() == first);
}
