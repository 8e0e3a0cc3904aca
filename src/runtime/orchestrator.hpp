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


// Tollgate Runtime Orchestrator - Header
// Command line, configuration layering, key resolution and the serve loop

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../core/logging.hpp"

namespace tollgate::runtime {

inline constexpr std::string_view kVersion = "0.1.0";

/// Parsed command line
struct CliOptions {
    std::optional<std::string> config_path;  // --config
    control::ConfigOverrides overrides;       // Highest-precedence layer
    bool show_help = false;
    bool show_version = false;
};

/// Parse arguments (without argv[0]); accepts "--flag value" and "--flag=value"
[[nodiscard]] std::optional<CliOptions> parse_command_line(const std::vector<std::string>& args,
                                                           std::string& error_out);

/// Print usage to stdout
void print_usage(const char* program);

/// Defaults < JSON file < environment < command line, then validate
/// Returns nullopt when the file cannot be loaded or validation reports errors
[[nodiscard]] std::optional<control::Config> resolve_config(const CliOptions& options,
                                                            const control::EnvLookup& env,
                                                            control::ValidationResult& validation_out);

/// Resolve the accepted key set through the configured key source
[[nodiscard]] std::optional<std::vector<std::string>> resolve_keys(const control::KeysConfig& keys,
                                                                   std::string& error_out);

/// Install SIGINT/SIGTERM handlers that request a graceful shutdown
void install_signal_handlers();

/// Ask a running run_proxy() to stop (async-signal-safe)
void request_shutdown() noexcept;

/// Build the proxy, bind, and serve until shutdown is requested
[[nodiscard]] std::error_code run_proxy(const control::Config& config,
                                        std::vector<std::string> keys, quill::Logger* logger);

}  // namespace tollgate::runtime
