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


// Tollgate API Key Authentication Middleware - Implementation

#include "auth_middleware.hpp"

#include <openssl/crypto.h>

namespace tollgate::gateway {

std::string_view to_string(AuthFailure failure) noexcept {
    switch (failure) {
        case AuthFailure::None:
            return "none";
        case AuthFailure::MissingHeader:
            return "missing authorization header";
        case AuthFailure::BadScheme:
            return "authorization scheme is not Bearer";
        case AuthFailure::UnknownKey:
            return "unknown API key";
    }
    return "unknown";
}

static bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool contains_key(const std::vector<std::string>& keys, std::string_view candidate) noexcept {
    bool found = false;
    for (const auto& key : keys) {
        found |= constant_time_equals(key, candidate);
    }
    return found;
}

AuthFailure check_bearer_key(const http::Request& request,
                             const std::vector<std::string>& keys) noexcept {
    const auto* header = request.find_header(http::kAuthorizationHeader);
    if (header == nullptr) {
        return AuthFailure::MissingHeader;
    }

    // Prefix is case-sensitive and requires exactly one space
    if (!header->value.starts_with(http::kBearerPrefix)) {
        return AuthFailure::BadScheme;
    }

    std::string_view candidate = header->value.substr(http::kBearerPrefix.size());
    if (!contains_key(keys, candidate)) {
        return AuthFailure::UnknownKey;
    }
    return AuthFailure::None;
}

MiddlewareResult ApiKeyAuthMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto failure = check_bearer_key(*ctx.request, state_->keys());
    if (failure != AuthFailure::None) {
        return send_401(ctx, failure);
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult ApiKeyAuthMiddleware::send_401(RequestContext& ctx, AuthFailure failure) const {
    if (logger_) {
        LOG_WARNING(logger_, "Request rejected: reason={}, client_ip={}, correlation_id={}",
                    to_string(failure), ctx.request->client_ip, ctx.correlation_id);
    }

    ctx.response->status = http::StatusCode::Unauthorized;
    ctx.response->add_header("WWW-Authenticate", "Bearer realm=\"tollgate\"");
    ctx.response->set_text("Unauthorized");
    ctx.set_metadata("reject_reason", std::string(to_string(failure)));

    return MiddlewareResult::Stop;
}

}  // namespace tollgate::gateway
