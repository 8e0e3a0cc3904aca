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


// Tollgate Proxy State - Header
// Immutable per-process bundle shared by every request handler

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "upstream.hpp"

namespace tollgate::gateway {

/// Accepted keys, upstream base URL and outbound transport
/// Built once at startup, read-only afterwards (shared as shared_ptr<const ProxyState>)
class ProxyState {
public:
    /// @param keys Accepted API keys (exact, case-sensitive match)
    /// @param base_url Upstream base URL; trailing slashes are removed
    /// @param transport Thread-safe outbound transport
    ProxyState(std::vector<std::string> keys, std::string_view base_url,
               std::shared_ptr<UpstreamTransport> transport);

    ProxyState(const ProxyState&) = delete;
    ProxyState& operator=(const ProxyState&) = delete;

    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

    /// Transport is internally synchronized, so it is usable through a const state
    [[nodiscard]] UpstreamTransport& transport() const noexcept { return *transport_; }

private:
    const std::vector<std::string> keys_;
    const std::string base_url_;
    const std::shared_ptr<UpstreamTransport> transport_;
};

/// Remove trailing '/' characters from a base URL
[[nodiscard]] std::string_view trim_trailing_slashes(std::string_view url) noexcept;

}  // namespace tollgate::gateway
