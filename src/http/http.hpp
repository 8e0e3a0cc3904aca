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

// Tollgate HTTP Protocol - Header
// HTTP value types shared by the serving layer and the proxy core

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tollgate::http {

/// Header names the proxy treats specially
inline constexpr std::string_view kAuthorizationHeader = "authorization";
inline constexpr std::string_view kHostHeader = "host";
inline constexpr std::string_view kBearerPrefix = "Bearer ";

/// HTTP status codes produced by the proxy itself
/// Upstream statuses outside this list are carried as StatusCode{n}
enum class StatusCode : uint16_t {
    OK = 200,

    BadRequest = 400,
    Unauthorized = 401,

    InternalServerError = 500,
    BadGateway = 502,
};

/// HTTP header (name-value pair)
/// Both name and value are views into storage owned by the serving layer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// Owned header, used by messages the proxy builds itself
using OwnedHeader = std::pair<std::string, std::string>;

/// Outcome of buffering the inbound body
enum class BodyStatus : uint8_t {
    Complete,   // Whole body buffered within the limit
    TooLarge,   // Limit exceeded, reading stopped early
    ReadFailed  // Connection failed while reading
};

/// Inbound request (borrowed from the serving layer, all views)
struct Request {
    std::string_view method;
    std::string_view path;         // Full path, e.g. "/v1/chat/completions"
    std::string_view path_suffix;  // Capture after the "/v1/" routing prefix
    std::vector<Header> headers;

    std::string_view body;
    BodyStatus body_status = BodyStatus::Complete;

    // Connection info
    std::string_view client_ip;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;
};

/// Client-facing response (owned)
struct Response {
    StatusCode status = StatusCode::OK;
    std::vector<OwnedHeader> headers;
    std::string body;

    // Helper: Get header value or default (first match, case-insensitive)
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Append header (duplicates allowed, order preserved)
    void add_header(std::string_view name, std::string_view value);

    // Helper: Set a plain-text body with matching Content-Type
    void set_text(std::string_view text);
};

/// Absolute URL split into the origin a client connects to and the request target
struct UrlParts {
    std::string origin;  // scheme://host[:port]
    std::string target;  // path (always starts with '/')
};

// Conversion functions

/// Numeric value of a status code
[[nodiscard]] constexpr uint16_t to_int(StatusCode code) noexcept {
    return static_cast<uint16_t>(code);
}

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

// Representability policies
//
// The proxy degrades leniently instead of failing a request: values that cannot be
// carried on the other leg are dropped (headers) or replaced by a fixed default
// (method, status). Each policy lives in exactly one function below.

/// RFC 9110 token (method names, header field names)
[[nodiscard]] bool is_token(std::string_view str) noexcept;

/// Header value consisting only of visible ASCII, space and horizontal tab
[[nodiscard]] bool is_text_header_value(std::string_view value) noexcept;

/// Header that can be forwarded as-is (token name, text value)
[[nodiscard]] bool is_representable_header(std::string_view name, std::string_view value) noexcept;

/// Method for the outbound leg: the inbound method when it is a valid token, GET otherwise
[[nodiscard]] std::string_view outbound_method(std::string_view method) noexcept;

/// Status for the client leg: the upstream code when in [100, 999], 200 otherwise
[[nodiscard]] StatusCode map_status(int code) noexcept;

/// Split an absolute http(s) URL into origin and target
/// Returns std::nullopt for other schemes or an empty host
[[nodiscard]] std::optional<UrlParts> split_url(std::string_view url);

}  // namespace tollgate::http
