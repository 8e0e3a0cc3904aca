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


// Tollgate API Key Authentication Middleware - Header

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pipeline.hpp"
#include "proxy_state.hpp"

namespace tollgate::gateway {

/// Why a request was rejected (logged, never sent to the client)
enum class AuthFailure : uint8_t {
    None,
    MissingHeader,  // No authorization header
    BadScheme,      // Value does not start with "Bearer "
    UnknownKey,     // Key not in the accepted set (or the set is empty)
};

[[nodiscard]] std::string_view to_string(AuthFailure failure) noexcept;

/// Constant-time membership test; always scans every key
[[nodiscard]] bool contains_key(const std::vector<std::string>& keys,
                                std::string_view candidate) noexcept;

/// Check the bearer key of a request against the accepted set
[[nodiscard]] AuthFailure check_bearer_key(const http::Request& request,
                                           const std::vector<std::string>& keys) noexcept;

/// Bearer API key middleware (Phase 1: Request validation)
class ApiKeyAuthMiddleware : public Middleware {
public:
    ApiKeyAuthMiddleware(std::shared_ptr<const ProxyState> state, quill::Logger* logger)
        : state_(std::move(state)), logger_(logger) {}
    ~ApiKeyAuthMiddleware() override = default;

    /// Process request phase (validate bearer key)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    [[nodiscard]] std::string_view name() const override { return "ApiKeyAuthMiddleware"; }

private:
    /// Send 401 Unauthorized response
    [[nodiscard]] MiddlewareResult send_401(RequestContext& ctx, AuthFailure failure) const;

    std::shared_ptr<const ProxyState> state_;
    quill::Logger* logger_;
};

}  // namespace tollgate::gateway
