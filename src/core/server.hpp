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


// Tollgate Server - Header
// cpp-httplib listener serving /v1/<rest> through the proxy handler

#pragma once

#include <httplib.h>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../gateway/proxy_handler.hpp"
#include "logging.hpp"

namespace tollgate::core {

/// Routing pattern; the capture is the path suffix after "/v1/"
inline constexpr const char* kProxyRoutePattern = R"(/v1/(.*))";

/// Name a multipart Content-Type is held under while its body is read as raw bytes
/// A parsed header name cannot contain ':', so no client header collides with it
inline constexpr const char* kParkedContentTypeHeader = ":content-type";

/// Header entries cpp-httplib adds to every request (not sent by the client)
[[nodiscard]] bool is_library_pseudo_header(std::string_view name) noexcept;

/// Methods served through a registered route; the rest are served from the pre-routing hook
[[nodiscard]] bool has_method_route(std::string_view method) noexcept;

/// Read an httplib request into the core's view type
/// The returned request borrows from req and body
[[nodiscard]] http::Request to_core_request(const httplib::Request& req, std::string_view suffix,
                                            std::string_view body, http::BodyStatus body_status);

/// Write a core response onto an httplib response (framing headers re-derived by the library)
void write_response(http::Response&& response, httplib::Response& res);

/// HTTP server managing the listener and worker thread pool
class ProxyServer {
public:
    /// Create server with configuration and the pre-built request handler
    ProxyServer(const control::Config& config, std::unique_ptr<gateway::ProxyHandler> handler,
                quill::Logger* logger);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /// Bind listen_address:listen_port (port 0 = ephemeral)
    [[nodiscard]] std::error_code bind();

    /// Accept and serve connections until stop() (blocking)
    [[nodiscard]] std::error_code run();

    /// Stop accepting and unblock run()
    void stop();

    /// Block until run() is accepting connections
    void wait_until_ready() const;

    [[nodiscard]] bool is_running() const { return server_.is_running(); }
    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] size_t worker_threads() const noexcept { return worker_threads_; }

private:
    void register_routes();

    /// Run one request through the handler and write the result
    void serve(const httplib::Request& req, httplib::Response& res, std::string_view suffix,
               std::string_view body, http::BodyStatus body_status) const;

    httplib::Server server_;
    std::unique_ptr<gateway::ProxyHandler> handler_;
    quill::Logger* logger_;

    std::string host_;
    int port_;
    size_t worker_threads_;
};

}  // namespace tollgate::core
