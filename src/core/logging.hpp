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

// Tollgate Logging - Header
// Quill asynchronous logging setup and structured logging helpers

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace tollgate::control {
struct LogConfig;
}

namespace tollgate::logging {

/// Name of the process logger (Quill registry key)
inline constexpr std::string_view kLoggerName = "tollgate";

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger with config-driven sink and level
// Console sink when config.output is empty or "stdout", rotating file otherwise
quill::Logger* init_logger(const tollgate::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Correlation IDs: {uuid-v4}#{counter}, base UUID generated once per thread
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_correlation_id(std::string_view id);

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace tollgate::logging
