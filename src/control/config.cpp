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


// Tollgate Configuration - Implementation

#include "config.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "../http/http.hpp"

namespace tollgate::control {

EnvLookup process_env() {
    return [](std::string_view name) -> std::optional<std::string> {
        std::string name_str{name};
        const char* value = std::getenv(name_str.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string{value};
    };
}

static std::string_view trim(std::string_view value) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    size_t start = value.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = value.find_last_not_of(kWhitespace);
    return value.substr(start, end - start + 1);
}

std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = value.size();
        }
        auto item = trim(value.substr(pos, comma - pos));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        pos = comma + 1;
    }
    return items;
}

std::optional<uint16_t> parse_port(std::string_view value) {
    if (value.empty()) {
        return std::nullopt;
    }
    uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    // Validation runs once the override layers are applied
    return config;
}

ConfigOverrides ConfigLoader::overrides_from_env(const EnvLookup& env) {
    ConfigOverrides overrides;

    overrides.ollama_url = env("OLLAMA_URL");
    overrides.proxy_host = env("PROXY_HOST");
    if (auto port = env("PROXY_PORT")) {
        // Unparsable values leave the lower layer's port in place
        overrides.proxy_port = parse_port(*port);
    }

    overrides.api_keys_sqlite = env("API_KEYS_SQLITE");
    overrides.api_keys_file = env("API_KEYS_FILE");
    if (auto keys = env("API_KEYS")) {
        overrides.api_keys = split_list(*keys);
    }

    return overrides;
}

void ConfigLoader::apply_overrides(Config& config, const ConfigOverrides& overrides) {
    if (overrides.ollama_url) {
        config.upstream.url = *overrides.ollama_url;
    }
    if (overrides.proxy_host) {
        config.server.listen_address = *overrides.proxy_host;
    }
    if (overrides.proxy_port) {
        config.server.listen_port = *overrides.proxy_port;
    }
    if (overrides.worker_threads) {
        config.server.worker_threads = *overrides.worker_threads;
    }
    if (overrides.log_level) {
        config.logging.level = *overrides.log_level;
    }

    if (overrides.api_keys_sqlite || overrides.api_keys_file || overrides.api_keys) {
        KeysConfig keys;
        keys.sqlite = overrides.api_keys_sqlite;
        keys.file = overrides.api_keys_file;
        keys.list = overrides.api_keys;
        config.keys = std::move(keys);
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_address.empty()) {
        result.add_error("server.listen_address must not be empty");
    }
    if (config.server.listen_port == 0 || config.server.listen_port > 65535) {
        result.add_error("server.listen_port must be between 1 and 65535");
    }

    // Upstream
    if (config.upstream.url.empty()) {
        result.add_error("upstream.url must not be empty");
    } else if (!http::split_url(config.upstream.url).has_value()) {
        result.add_error("upstream.url must be an http:// or https:// URL with a host: " +
                         config.upstream.url);
    }
    if (config.upstream.pool_size == 0) {
        result.add_error("upstream.pool_size must be at least 1");
    }

    // Keys
    if (!config.keys.has_source()) {
        result.add_warning("No API key source configured, every request will be rejected");
    } else if (!config.keys.sqlite && !config.keys.file && config.keys.list->empty()) {
        result.add_warning("API key list is empty, every request will be rejected");
    }

    // Logging
    const auto& level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_error("logging.level must be one of debug, info, warning, error: " + level);
    }
    if (config.logging.format != "text" && config.logging.format != "json") {
        result.add_error("logging.format must be 'text' or 'json': " + config.logging.format);
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

}  // namespace tollgate::control
