/*
 * Copyright 2026 Tollgate Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Tollgate Configuration - Header
// JSON configuration schema using nlohmann/json, layered with environment and CLI overrides

#pragma once

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::control {

/// Listener configuration
struct ServerConfig {
    uint32_t worker_threads = 0;  // 0 = hardware concurrency

    std::string listen_address = "0.0.0.0";
    uint32_t listen_port = 3000;  // Wider than a port so validate() sees out-of-range values
};

/// Inference service (upstream) configuration
struct UpstreamConfig {
    std::string url = "http://127.0.0.1:11434";  // Base URL, may carry a path prefix

    // Keep-alive client pool
    uint32_t pool_size = 64;
    uint32_t pool_idle_timeout = 60;  // seconds
};

/// API key source selection
/// Precedence when several are set: sqlite > file > list
struct KeysConfig {
    std::optional<std::string> sqlite;              // Database with table api_keys(key TEXT)
    std::optional<std::string> file;                // Comma/newline separated key file
    std::optional<std::vector<std::string>> list;  // Explicit keys

    [[nodiscard]] bool has_source() const noexcept {
        return sqlite.has_value() || file.has_value() || list.has_value();
    }
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // json, text
    std::string output;           // Empty or "stdout" = console, otherwise log directory
    bool log_requests = true;
    std::vector<std::string> exclude_paths;  // Don't log these paths

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Tollgate configuration
struct Config {
    ServerConfig server;
    UpstreamConfig upstream;
    KeysConfig keys;
    LogConfig logging;
};

/// Values supplied by one override layer (environment or command line)
/// Unset members leave the lower layer untouched
struct ConfigOverrides {
    std::optional<std::string> ollama_url;
    std::optional<std::string> proxy_host;
    std::optional<uint16_t> proxy_port;
    std::optional<uint32_t> worker_threads;
    std::optional<std::string> log_level;

    std::optional<std::string> api_keys_sqlite;
    std::optional<std::string> api_keys_file;
    std::optional<std::vector<std::string>> api_keys;
};

/// Environment lookup, injectable so tests never touch the process environment
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Lookup backed by std::getenv
[[nodiscard]] EnvLookup process_env();

/// Split a comma separated list, trimming entries and dropping empty ones
[[nodiscard]] std::vector<std::string> split_list(std::string_view value);

/// Parse a TCP port (1-65535), nullopt when not a plain decimal number in range
[[nodiscard]] std::optional<uint16_t> parse_port(std::string_view value);

// JSON serialization
// All config types use custom from_json/to_json so partial files keep defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.worker_threads = j.value("worker_threads", 0u);
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", 3000u);
}

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    u.url = j.value("url", std::string("http://127.0.0.1:11434"));
    u.pool_size = j.value("pool_size", 64u);
    u.pool_idle_timeout = j.value("pool_idle_timeout", 60u);
}

inline void from_json(const nlohmann::json& j, KeysConfig& k) {
    if (j.contains("sqlite")) {
        k.sqlite = j.at("sqlite").get<std::string>();
    }
    if (j.contains("file")) {
        k.file = j.at("file").get<std::string>();
    }
    if (j.contains("list")) {
        k.list = j.at("list").get<std::vector<std::string>>();
    }
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    l.log_requests = j.value("log_requests", true);
    l.exclude_paths = j.value("exclude_paths", std::vector<std::string>());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps defaults for absent sections
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("upstream")) {
        j.at("upstream").get_to(c.upstream);
    }
    if (j.contains("keys")) {
        j.at("keys").get_to(c.keys);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"worker_threads", s.worker_threads},
                       {"listen_address", s.listen_address},
                       {"listen_port", s.listen_port}};
}

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{
        {"url", u.url}, {"pool_size", u.pool_size}, {"pool_idle_timeout", u.pool_idle_timeout}};
}

inline void to_json(nlohmann::json& j, const KeysConfig& k) {
    // Key values are never serialized, only which sources are configured
    j = nlohmann::json::object();
    if (k.sqlite) {
        j["sqlite"] = *k.sqlite;
    }
    if (k.file) {
        j["file"] = *k.file;
    }
    if (k.list) {
        j["list_size"] = k.list->size();
    }
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"exclude_paths", l.exclude_paths},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"server", c.server},
                       {"upstream", c.upstream},
                       {"keys", c.keys},
                       {"logging", c.logging}};
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (parse only, call validate() on the final result)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Read the override layer carried by environment variables
    /// OLLAMA_URL, PROXY_HOST, PROXY_PORT, API_KEYS, API_KEYS_FILE, API_KEYS_SQLITE
    [[nodiscard]] static ConfigOverrides overrides_from_env(const EnvLookup& env);

    /// Apply the set members of an override layer
    /// A layer naming any key source replaces the key selection below it
    static void apply_overrides(Config& config, const ConfigOverrides& overrides);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Serialize configuration to JSON string (key values omitted)
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace tollgate::control
