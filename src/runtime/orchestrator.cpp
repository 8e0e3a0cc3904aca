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


// Tollgate Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

#include "../control/key_source.hpp"
#include "../core/server.hpp"
#include "../gateway/factory.hpp"

namespace tollgate::runtime {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

std::optional<uint32_t> parse_uint(std::string_view value) {
    uint32_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

std::optional<CliOptions> parse_command_line(const std::vector<std::string>& args,
                                             std::string& error_out) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-V") {
            options.show_version = true;
            continue;
        }

        if (!arg.starts_with("--")) {
            error_out = "Unexpected argument: " + std::string(arg);
            return std::nullopt;
        }

        // --flag=value or --flag value
        std::string_view flag = arg;
        std::string value;
        if (auto eq = arg.find('='); eq != std::string_view::npos) {
            flag = arg.substr(0, eq);
            value = std::string(arg.substr(eq + 1));
        } else {
            if (i + 1 >= args.size()) {
                error_out = "Missing value for " + std::string(flag);
                return std::nullopt;
            }
            value = args[++i];
        }

        auto& overrides = options.overrides;
        if (flag == "--config") {
            options.config_path = value;
        } else if (flag == "--ollama-url") {
            overrides.ollama_url = value;
        } else if (flag == "--api-keys") {
            overrides.api_keys = control::split_list(value);
        } else if (flag == "--api-keys-file") {
            overrides.api_keys_file = value;
        } else if (flag == "--api-keys-sqlite") {
            overrides.api_keys_sqlite = value;
        } else if (flag == "--proxy-host") {
            overrides.proxy_host = value;
        } else if (flag == "--proxy-port") {
            auto port = control::parse_port(value);
            if (!port) {
                error_out = "Invalid port for --proxy-port: " + value;
                return std::nullopt;
            }
            overrides.proxy_port = *port;
        } else if (flag == "--workers") {
            auto workers = parse_uint(value);
            if (!workers) {
                error_out = "Invalid number for --workers: " + value;
                return std::nullopt;
            }
            overrides.worker_threads = *workers;
        } else if (flag == "--log-level") {
            overrides.log_level = value;
        } else {
            error_out = "Unknown option: " + std::string(flag);
            return std::nullopt;
        }
    }

    return options;
}

void print_usage(const char* program) {
    printf("Usage: %s [options]\n\n", program);
    printf("Authenticating reverse proxy for a local inference service.\n\n");
    printf("Options:\n");
    printf("  --config <path>           JSON configuration file\n");
    printf("  --ollama-url <url>        Upstream base URL (env OLLAMA_URL)\n");
    printf("  --api-keys <a,b,...>      Comma-separated API keys (env API_KEYS)\n");
    printf("  --api-keys-file <path>    Comma/newline separated key file (env API_KEYS_FILE)\n");
    printf("  --api-keys-sqlite <path>  SQLite database with api_keys(key TEXT) "
           "(env API_KEYS_SQLITE)\n");
    printf("  --proxy-host <addr>       Listen address (env PROXY_HOST, default 0.0.0.0)\n");
    printf("  --proxy-port <port>       Listen port (env PROXY_PORT, default 3000)\n");
    printf("  --workers <n>             Worker threads (0 = hardware concurrency)\n");
    printf("  --log-level <level>       debug, info, warning or error\n");
    printf("  -h, --help                Show this help\n");
    printf("  -V, --version             Show version\n");
}

std::optional<control::Config> resolve_config(const CliOptions& options,
                                              const control::EnvLookup& env,
                                              control::ValidationResult& validation_out) {
    control::Config config;

    if (options.config_path) {
        auto loaded = control::ConfigLoader::load_from_file(*options.config_path);
        if (!loaded) {
            validation_out = {};
            validation_out.add_error("Failed to load configuration file: " +
                                     *options.config_path);
            return std::nullopt;
        }
        config = std::move(*loaded);
    }

    control::ConfigLoader::apply_overrides(config,
                                           control::ConfigLoader::overrides_from_env(env));
    control::ConfigLoader::apply_overrides(config, options.overrides);

    validation_out = control::ConfigLoader::validate(config);
    if (validation_out.has_errors()) {
        return std::nullopt;
    }
    return config;
}

std::optional<std::vector<std::string>> resolve_keys(const control::KeysConfig& keys,
                                                     std::string& error_out) {
    auto source = control::make_key_source(keys);

    std::error_code ec;
    auto resolved = source->resolve_keys(ec);
    if (!resolved) {
        error_out = "Failed to load API keys from " + source->describe() + ": " + ec.message();
        return std::nullopt;
    }
    return resolved;
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
}

void request_shutdown() noexcept {
    g_shutdown_requested.store(true);
}

std::error_code run_proxy(const control::Config& config, std::vector<std::string> keys,
                          quill::Logger* logger) {
    g_shutdown_requested.store(false);

    size_t key_count = keys.size();
    auto transport = gateway::build_transport(config);
    auto state = gateway::build_proxy_state(config, std::move(keys), transport);
    auto handler = gateway::build_proxy_handler(config, state, logger);

    core::ProxyServer server(config, std::move(handler), logger);
    if (auto ec = server.bind(); ec) {
        LOG_ERROR(logger, "Failed to bind {}:{}: {}", config.server.listen_address,
                  config.server.listen_port, ec.message());
        return ec;
    }

    LOG_INFO(logger, "Forwarding /v1/* to {} with {} accepted API keys", state->base_url(),
             key_count);
    if (key_count == 0) {
        LOG_WARNING(logger, "No API keys configured, every request will be rejected");
    }
    printf("Listening on %s:%d\n", server.host().c_str(), server.port());
    fflush(stdout);

    std::error_code run_ec;
    std::atomic<bool> server_done{false};
    std::thread server_thread([&] {
        run_ec = server.run();
        server_done.store(true);
    });

    while (!g_shutdown_requested.load() && !server_done.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (g_shutdown_requested.load()) {
        LOG_INFO(logger, "Shutdown requested, stopping listener");
    }
    if (!server_done.load()) {
        // stop() is a no-op until the accept loop has started
        server.wait_until_ready();
    }
    server.stop();
    server_thread.join();

    transport->pool().log_stats(logger);
    return run_ec;
}

}  // namespace tollgate::runtime
