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


// Tollgate Proxy Handler - Header
// Per-request flow: pipeline (auth, body limit) -> forwarder -> response mapper

#pragma once

#include <memory>

#include "forwarder.hpp"
#include "pipeline.hpp"
#include "proxy_state.hpp"
#include "response_mapper.hpp"

namespace tollgate::gateway {

/// Stateless per request; safe to call from any number of worker threads
class ProxyHandler {
public:
    ProxyHandler(std::shared_ptr<const ProxyState> state, Pipeline pipeline,
                 quill::Logger* logger);

    ProxyHandler(const ProxyHandler&) = delete;
    ProxyHandler& operator=(const ProxyHandler&) = delete;

    /// Produce the client-facing response for one inbound request
    [[nodiscard]] http::Response handle(const http::Request& request) const;

private:
    Pipeline pipeline_;
    RequestForwarder forwarder_;
    ResponseMapper mapper_;
    quill::Logger* logger_;
};

}  // namespace tollgate::gateway
