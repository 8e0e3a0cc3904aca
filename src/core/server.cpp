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


// Tollgate Server - Implementation

#include "server.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <exception>
#include <thread>

#include "../gateway/forwarder.hpp"

namespace tollgate::core {

namespace {

// Set once the core has produced the response for the request on this worker thread
// cpp-httplib runs every hook and handler of one request on the same thread
thread_local bool t_served_by_core = false;

constexpr int kLibraryPayloadTooLarge = 413;

}  // namespace

bool is_library_pseudo_header(std::string_view name) noexcept {
    return name == "REMOTE_ADDR" || name == "REMOTE_PORT" || name == "LOCAL_ADDR" ||
           name == "LOCAL_PORT";
}

bool has_method_route(std::string_view method) noexcept {
    return method == "GET" || method == "HEAD" || method == "POST" || method == "PUT" ||
           method == "PATCH" || method == "DELETE" || method == "OPTIONS";
}

http::Request to_core_request(const httplib::Request& req, std::string_view suffix,
                              std::string_view body, http::BodyStatus body_status) {
    http::Request request;
    request.method = req.method;
    request.path = req.path;
    request.path_suffix = suffix;
    request.client_ip = req.remote_addr;

    request.headers.reserve(req.headers.size());
    for (const auto& [name, value] : req.headers) {
        if (name == kParkedContentTypeHeader) {
            request.headers.push_back(http::Header{"Content-Type", value});
        } else if (!is_library_pseudo_header(name)) {
            request.headers.push_back(http::Header{name, value});
        }
    }

    request.body = body;
    request.body_status = body_status;
    return request;
}

void write_response(http::Response&& response, httplib::Response& res) {
    res.status = http::to_int(response.status);
    for (auto& [name, value] : response.headers) {
        if (!gateway::is_framing_header(name)) {
            res.headers.emplace(std::move(name), std::move(value));
        }
    }
    res.body = std::move(response.body);
}

// Declared Content-Length above the limit (false when absent or unparsable)
static bool exceeds_body_limit(const httplib::Request& req) {
    if (!req.has_header("Content-Length")) {
        return false;
    }
    auto value = req.get_header_value("Content-Length");
    uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec == std::errc::result_out_of_range) {
        return true;
    }
    return ec == std::errc{} && length > gateway::kMaxBodySize;
}

static bool declares_body(const httplib::Request& req) {
    if (req.has_header("Transfer-Encoding")) {
        return true;
    }
    return req.has_header("Content-Length") && req.get_header_value("Content-Length") != "0";
}

// The library parses multipart/form-data bodies itself and never hands over the raw
// bytes. Renaming the header before the body is read turns it into an opaque body;
// to_core_request() restores the name. req is the library's own non-const instance.
static void park_multipart_content_type(const httplib::Request& req) {
    auto& headers = const_cast<httplib::Request&>(req).headers;
    auto value = req.get_header_value("Content-Type");
    headers.erase("Content-Type");
    headers.emplace(kParkedContentTypeHeader, std::move(value));
}

static std::string_view route_suffix(const httplib::Request& req) {
    return std::string_view(req.path).substr(gateway::kRoutePrefix.size());
}

ProxyServer::ProxyServer(const control::Config& config,
                         std::unique_ptr<gateway::ProxyHandler> handler, quill::Logger* logger)
    : handler_(std::move(handler)),
      logger_(logger),
      host_(config.server.listen_address),
      port_(static_cast<int>(config.server.listen_port)),
      worker_threads_(config.server.worker_threads) {
    if (worker_threads_ == 0) {
        worker_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }

    const size_t pool_size = worker_threads_;
    server_.new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // One byte of headroom so an over-limit body reaches our own check
    server_.set_payload_max_length(gateway::kMaxBodySize + 1);

    register_routes();
}

ProxyServer::~ProxyServer() {
    stop();
}

void ProxyServer::register_routes() {
    server_.set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) {
            t_served_by_core = false;
            if (!std::string_view(req.path).starts_with(gateway::kRoutePrefix)) {
                return httplib::Server::HandlerResponse::Unhandled;
            }

            // Declared over-limit body: answer without reading it
            // The request still runs through the pipeline so authentication is checked first
            if (exceeds_body_limit(req)) {
                serve(req, res, route_suffix(req), {}, http::BodyStatus::TooLarge);
                res.set_header("Connection", "close");
                return httplib::Server::HandlerResponse::Handled;
            }

            // Methods the library parses but cannot route (TRACE, CONNECT)
            // Their body is not readable from this hook
            if (!has_method_route(req.method)) {
                auto status = declares_body(req) ? http::BodyStatus::ReadFailed
                                                  : http::BodyStatus::Complete;
                serve(req, res, route_suffix(req), {}, status);
                if (status != http::BodyStatus::Complete) {
                    res.set_header("Connection", "close");
                }
                return httplib::Server::HandlerResponse::Handled;
            }

            if (req.is_multipart_form_data()) {
                park_multipart_content_type(req);
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

    // GET (and HEAD): the library buffers any body into req.body
    server_.Get(kProxyRoutePattern, [this](const httplib::Request& req, httplib::Response& res) {
        auto status = req.body.size() > gateway::kMaxBodySize ? http::BodyStatus::TooLarge
                                                              : http::BodyStatus::Complete;
        serve(req, res, req.matches[1].str(), req.body, status);
    });

    auto with_body = [this](const httplib::Request& req, httplib::Response& res,
                            const httplib::ContentReader& content_reader) {
        std::string body;
        bool too_large = false;
        bool complete = content_reader([&](const char* data, size_t length) {
            if (body.size() + length > gateway::kMaxBodySize) {
                too_large = true;
                return false;  // Stop reading
            }
            body.append(data, length);
            return true;
        });

        auto status = too_large  ? http::BodyStatus::TooLarge
                      : complete ? http::BodyStatus::Complete
                                 : http::BodyStatus::ReadFailed;
        serve(req, res, req.matches[1].str(), body, status);
        if (status != http::BodyStatus::Complete) {
            // Unread body bytes make the connection unusable
            res.set_header("Connection", "close");
        }
    };
    server_.Post(kProxyRoutePattern, with_body);
    server_.Put(kProxyRoutePattern, with_body);
    server_.Patch(kProxyRoutePattern, with_body);
    server_.Delete(kProxyRoutePattern, with_body);

    server_.Options(kProxyRoutePattern,
                    [this](const httplib::Request& req, httplib::Response& res) {
                        serve(req, res, req.matches[1].str(), req.body,
                              http::BodyStatus::Complete);
                    });

    // A body the library refused while buffering it (chunked GET over the limit)
    // gets the same answer as one our own readers stop, authentication first
    server_.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (t_served_by_core || res.status != kLibraryPayloadTooLarge ||
            !std::string_view(req.path).starts_with(gateway::kRoutePrefix)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        res.headers.clear();
        res.body.clear();
        serve(req, res, route_suffix(req), {}, http::BodyStatus::TooLarge);
        res.set_header("Connection", "close");
        return httplib::Server::HandlerResponse::Handled;
    });

    // Last resort: anything thrown while serving becomes an empty 500
    server_.set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string detail = "unknown exception";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                detail = e.what();
            } catch (...) {
                // detail stays "unknown exception"
            }
            if (logger_) {
                LOG_ERROR(logger_, "Unhandled exception serving {} {}: {}", req.method, req.path,
                          detail);
            }
            res.status = http::to_int(http::StatusCode::InternalServerError);
            res.headers.clear();
            res.body.clear();
        });
}

void ProxyServer::serve(const httplib::Request& req, httplib::Response& res,
                        std::string_view suffix, std::string_view body,
                        http::BodyStatus body_status) const {
    auto request = to_core_request(req, suffix, body, body_status);
    write_response(handler_->handle(request), res);
    t_served_by_core = true;
}

std::error_code ProxyServer::bind() {
    errno = 0;
    if (port_ == 0) {
        int port = server_.bind_to_any_port(host_);
        if (port < 0) {
            return std::error_code(errno != 0 ? errno : EADDRNOTAVAIL, std::generic_category());
        }
        port_ = port;
        return {};
    }

    if (!server_.bind_to_port(host_, port_)) {
        return std::error_code(errno != 0 ? errno : EADDRNOTAVAIL, std::generic_category());
    }
    return {};
}

std::error_code ProxyServer::run() {
    if (logger_) {
        LOG_INFO(logger_, "Listening on {}:{} ({} worker threads)", host_, port_,
                 worker_threads_);
    }
    if (!server_.listen_after_bind()) {
        return std::make_error_code(std::errc::not_connected);
    }
    return {};
}

void ProxyServer::stop() {
    if (server_.is_running()) {
        server_.stop();
    }
}

void ProxyServer::wait_until_ready() const {
    server_.wait_until_ready();
}

}  // namespace tollgate::core
