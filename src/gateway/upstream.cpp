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


// Tollgate Upstream - Implementation

#include "upstream.hpp"

namespace tollgate::gateway {

std::string TransportErrorCategory::message(int ev) const {
    return httplib::to_string(static_cast<httplib::Error>(ev));
}

const TransportErrorCategory& transport_category() noexcept {
    static TransportErrorCategory instance;
    return instance;
}

std::error_code make_transport_error(httplib::Error error) noexcept {
    if (error == httplib::Error::Success) {
        // A failed result always carries a failure code
        error = httplib::Error::Unknown;
    }
    return {static_cast<int>(error), transport_category()};
}

bool is_framing_header(std::string_view name) noexcept {
    return http::header_name_equals(name, "content-length") ||
           http::header_name_equals(name, "transfer-encoding");
}

std::optional<UpstreamResponse> HttpClientTransport::send(const OutboundRequest& request,
                                                          std::error_code& error_out) {
    auto parts = http::split_url(request.url);
    if (!parts) {
        error_out = make_transport_error(httplib::Error::Connection);
        return std::nullopt;
    }

    auto client = pool_->acquire(parts->origin);
    if (!client) {
        error_out = make_transport_error(httplib::Error::Connection);
        return std::nullopt;
    }

    httplib::Request req;
    req.method = request.method;
    req.path = parts->target;
    for (const auto& [name, value] : request.headers) {
        if (!is_framing_header(name)) {
            req.headers.emplace(name, value);
        }
    }
    req.body = request.body;

    auto result = client->send(req);
    if (!result) {
        error_out = make_transport_error(result.error());
        pool_->release(parts->origin, std::move(client), false);
        return std::nullopt;
    }

    UpstreamResponse response;
    response.status = result->status;
    response.headers.reserve(result->headers.size());
    for (const auto& [name, value] : result->headers) {
        response.headers.emplace_back(name, value);
    }
    response.body = std::move(result->body);

    pool_->release(parts->origin, std::move(client), true);

    error_out.clear();
    return response;
}

}  // namespace tollgate::gateway
