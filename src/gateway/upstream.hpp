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


// Tollgate Upstream - Header
// Transport seam between the proxy core and the inference service

#pragma once

#include <httplib.h>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../http/http.hpp"
#include "connection_pool.hpp"

namespace tollgate::gateway {

/// Fully built request for the inference service
struct OutboundRequest {
    std::string method;  // Valid method token
    std::string url;     // <base>/v1/<rest>
    std::vector<http::OwnedHeader> headers;
    std::string body;
};

/// Response received from the inference service, before mapping
struct UpstreamResponse {
    int status = 0;  // Raw status as received
    std::vector<http::OwnedHeader> headers;
    std::string body;
};

/// Error category for transport failures (values are httplib::Error)
class TransportErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "transport"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get transport error category singleton
[[nodiscard]] const TransportErrorCategory& transport_category() noexcept;

[[nodiscard]] std::error_code make_transport_error(httplib::Error error) noexcept;

/// Sends one request and waits for the complete response
class UpstreamTransport {
public:
    virtual ~UpstreamTransport() = default;

    /// Returns the response, or nullopt with error_out set when no response was received
    [[nodiscard]] virtual std::optional<UpstreamResponse> send(const OutboundRequest& request,
                                                               std::error_code& error_out) = 0;
};

/// Transport over pooled keep-alive cpp-httplib clients
class HttpClientTransport : public UpstreamTransport {
public:
    explicit HttpClientTransport(std::shared_ptr<UpstreamClientPool> pool)
        : pool_(std::move(pool)) {}

    [[nodiscard]] std::optional<UpstreamResponse> send(const OutboundRequest& request,
                                                       std::error_code& error_out) override;

    [[nodiscard]] const UpstreamClientPool& pool() const noexcept { return *pool_; }

private:
    std::shared_ptr<UpstreamClientPool> pool_;
};

/// Message framing headers, re-derived by the HTTP library for buffered bodies
[[nodiscard]] bool is_framing_header(std::string_view name) noexcept;

}  // namespace tollgate::gateway
