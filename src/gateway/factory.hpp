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


// Gateway Component Factory - Header
// Factory functions for building gateway components (ProxyState, Pipeline, ProxyHandler)

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../control/config.hpp"
#include "pipeline.hpp"
#include "proxy_handler.hpp"
#include "proxy_state.hpp"

namespace tollgate::gateway {

/// Build the pooled HTTP transport from configuration
[[nodiscard]] std::shared_ptr<HttpClientTransport> build_transport(const control::Config& config);

/// Build the shared, immutable proxy state
[[nodiscard]] std::shared_ptr<const ProxyState> build_proxy_state(
    const control::Config& config, std::vector<std::string> keys,
    std::shared_ptr<UpstreamTransport> transport);

/// Build middleware pipeline: authentication, body limit, access log
[[nodiscard]] Pipeline build_pipeline(const control::Config& config,
                                      std::shared_ptr<const ProxyState> state,
                                      quill::Logger* logger);

/// Build the request handler served by the HTTP server
[[nodiscard]] std::unique_ptr<ProxyHandler> build_proxy_handler(
    const control::Config& config, std::shared_ptr<const ProxyState> state,
    quill::Logger* logger);

}  // namespace tollgate::gateway
