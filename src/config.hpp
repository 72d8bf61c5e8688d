#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace stepstream {

// Request context forwarded verbatim to the planner endpoints.
struct AuthConfig {
    std::string token;     // sent as "Authorization: Bearer <token>"
    std::string device_id; // x-device-id
    std::string timezone;  // x-timezone (IANA name)
};

struct StreamConfig {
    uint32_t reconnect_base_ms = 1000;
    uint32_t reconnect_max_ms = 15000;
    uint32_t max_attempts = 0;     // 0 = reconnect forever
    uint32_t connect_timeout = 30; // seconds
    bool stop_on_completion = true;
};

struct ReplayConfig {
    uint32_t page_limit = 200;
};

struct Config {
    std::string base_url = "http://127.0.0.1:3001";
    AuthConfig auth;
    StreamConfig stream;
    ReplayConfig replay;

    // Load from ~/.stepstream/config.json + env vars
    static Config load();

    // Build from an already-parsed JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();
};

} // namespace stepstream
