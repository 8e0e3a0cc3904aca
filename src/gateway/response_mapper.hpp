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


// Tollgate Response Mapper - Header
// Upstream result (response or transport failure) to client-facing response

#pragma once

#include <optional>
#include <string_view>
#include <system_error>

#include "../core/logging.hpp"
#include "../http/http.hpp"
#include "upstream.hpp"

namespace tollgate::gateway {

/// Body of the 502 response sent when the upstream could not be reached
inline constexpr std::string_view kUpstreamFailedBody = "Upstream request failed";

class ResponseMapper {
public:
    explicit ResponseMapper(quill::Logger* logger = nullptr) : logger_(logger) {}

    /// Map the result of RequestForwarder::forward
    /// Falls back to internal_error() if the response cannot be assembled
    [[nodiscard]] http::Response map(std::optional<UpstreamResponse> upstream,
                                     const std::error_code& error,
                                     std::string_view correlation_id) const;

    /// Relay status, text headers and body of an upstream response (may throw)
    [[nodiscard]] static http::Response map_upstream(UpstreamResponse&& upstream);

    /// 502 with a fixed diagnostic body
    [[nodiscard]] static http::Response upstream_failure();

    /// 500 with an empty body
    [[nodiscard]] static http::Response internal_error() noexcept;

private:
    quill::Logger* logger_;
};

}  // namespace tollgate::gateway
