#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace stepstream {

static const char* kConfigPath = "~/.stepstream/config.json";

nlohmann::json Config::defaults_json() {
    return {
        {"base_url", "http://127.0.0.1:3001"},
        {"auth", {
            {"token", ""},
            {"device_id", ""},
            {"timezone", ""}
        }},
        {"stream", {
            {"reconnect_base_ms", 1000},
            {"reconnect_max_ms", 15000},
            {"max_attempts", 0},
            {"connect_timeout", 30},
            {"stop_on_completion", true}
        }},
        {"replay", {
            {"page_limit", 200}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "base_url", cfg.base_url);

    if (j.contains("auth") && j["auth"].is_object()) {
        const auto& a = j["auth"];
        read_string(a, "token", cfg.auth.token);
        read_string(a, "device_id", cfg.auth.device_id);
        read_string(a, "timezone", cfg.auth.timezone);
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        const auto& s = j["stream"];
        read_uint(s, "reconnect_base_ms", cfg.stream.reconnect_base_ms);
        read_uint(s, "reconnect_max_ms", cfg.stream.reconnect_max_ms);
        read_uint(s, "max_attempts", cfg.stream.max_attempts);
        read_uint(s, "connect_timeout", cfg.stream.connect_timeout);
        if (s.contains("stop_on_completion") && s["stop_on_completion"].is_boolean())
            cfg.stream.stop_on_completion = s["stop_on_completion"].get<bool>();
    }
    if (cfg.stream.reconnect_max_ms < cfg.stream.reconnect_base_ms)
        cfg.stream.reconnect_max_ms = cfg.stream.reconnect_base_ms;

    if (j.contains("replay") && j["replay"].is_object()) {
        read_uint(j["replay"], "page_limit", cfg.replay.page_limit);
        if (cfg.replay.page_limit == 0) cfg.replay.page_limit = 200;
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home(kConfigPath);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("STEPSTREAM_BASE_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("STEPSTREAM_TOKEN"))
        cfg.auth.token = v;
    if (const char* v = std::getenv("STEPSTREAM_DEVICE_ID"))
        cfg.auth.device_id = v;
    if (const char* v = std::getenv("STEPSTREAM_TIMEZONE")) {
        cfg.auth.timezone = v;
    } else if (cfg.auth.timezone.empty()) {
        if (const char* tz = std::getenv("TZ")) cfg.auth.timezone = tz;
    }

    return cfg;
}

} // namespace stepstream
