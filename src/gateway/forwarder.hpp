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


// Tollgate Request Forwarder - Header
// Builds the outbound request for an authorized inbound request and dispatches it

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "proxy_state.hpp"
#include "upstream.hpp"

namespace tollgate::gateway {

/// Inbound body size limit (8 MiB); a body of exactly this size is forwarded
inline constexpr size_t kMaxBodySize = 8 * 1024 * 1024;

/// Routing prefix shared by the inbound and outbound sides
inline constexpr std::string_view kRoutePrefix = "/v1/";

/// <base_url>/v1/<path_suffix>
[[nodiscard]] std::string build_target_url(std::string_view base_url,
                                           std::string_view path_suffix);

/// Whether an inbound header is copied to the outbound request
/// host and authorization are never forwarded; non-representable headers are dropped
[[nodiscard]] bool is_forwarded_header(std::string_view name, std::string_view value) noexcept;

/// Build the outbound request (method fallback, header filtering, body copy)
[[nodiscard]] OutboundRequest build_outbound_request(const http::Request& request,
                                                     std::string_view base_url);

/// Sends exactly one outbound request per call, no retries
class RequestForwarder {
public:
    explicit RequestForwarder(std::shared_ptr<const ProxyState> state) : state_(std::move(state)) {}

    /// Returns the upstream response, or nullopt with error_out set on transport failure
    [[nodiscard]] std::optional<UpstreamResponse> forward(const http::Request& request,
                                                          std::error_code& error_out) const;

private:
    std::shared_ptr<const ProxyState> state_;
};

}  // namespace tollgate::gateway
