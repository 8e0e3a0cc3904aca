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


// Tollgate Pipeline - Header
// Two-phase middleware chain around the forwarding step

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../core/logging.hpp"
#include "../http/http.hpp"

namespace tollgate::gateway {

/// Request context (passed through middleware chain)
struct RequestContext {
    const http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Timing
    std::chrono::steady_clock::time_point start_time;

    // Metadata (for middleware communication)
    std::unordered_map<std::string, std::string> metadata;

    // Error handling
    bool has_error = false;
    std::string error_message;

    /// Helper: Set error
    void set_error(std::string message) {
        has_error = true;
        error_message = std::move(message);
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }
};

/// Response context (passed through response middleware chain)
struct ResponseContext {
    const http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Timing
    std::chrono::steady_clock::time_point start_time;
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (response already set)
    Error      // Error occurred
};

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before forwarding)
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after the response is assembled)
    [[nodiscard]] virtual MiddlewareResult process_response(ResponseContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Rejects requests whose body was not buffered completely within the size limit
class BodyLimitMiddleware : public Middleware {
public:
    explicit BodyLimitMiddleware(size_t max_body_size) : max_body_size_(max_body_size) {}

    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "BodyLimitMiddleware"; }

private:
    size_t max_body_size_;
};

/// Access logging middleware (logs in response phase with timing)
class LoggingMiddleware : public Middleware {
public:
    LoggingMiddleware(quill::Logger* logger, std::vector<std::string> exclude_paths)
        : logger_(logger), exclude_paths_(exclude_paths.begin(), exclude_paths.end()) {}

    MiddlewareResult process_response(ResponseContext& ctx) override;
    std::string_view name() const override { return "LoggingMiddleware"; }

private:
    quill::Logger* logger_;
    std::unordered_set<std::string> exclude_paths_;
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Execute request phase (before forwarding)
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx) const;

    /// Execute response phase (after the response is assembled)
    [[nodiscard]] MiddlewareResult execute_response(ResponseContext& ctx) const;

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

}  // namespace tollgate::gateway
