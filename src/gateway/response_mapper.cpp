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


// Tollgate Response Mapper - Implementation

#include "response_mapper.hpp"

#include <exception>

namespace tollgate::gateway {

http::Response ResponseMapper::map_upstream(UpstreamResponse&& upstream) {
    http::Response response;
    response.status = http::map_status(upstream.status);

    response.headers.reserve(upstream.headers.size());
    for (auto& [name, value] : upstream.headers) {
        if (http::is_representable_header(name, value)) {
            response.headers.emplace_back(std::move(name), std::move(value));
        }
    }

    response.body = std::move(upstream.body);
    return response;
}

http::Response ResponseMapper::upstream_failure() {
    http::Response response;
    response.status = http::StatusCode::BadGateway;
    response.set_text(kUpstreamFailedBody);
    return response;
}

http::Response ResponseMapper::internal_error() noexcept {
    http::Response response;
    response.status = http::StatusCode::InternalServerError;
    return response;
}

http::Response ResponseMapper::map(std::optional<UpstreamResponse> upstream,
                                   const std::error_code& error,
                                   std::string_view correlation_id) const {
    if (!upstream) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Upstream request failed", correlation_id, error.value(),
                          error.message());
        }
        return upstream_failure();
    }

    try {
        return map_upstream(std::move(*upstream));
    } catch (const std::exception& e) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Response assembly failed", correlation_id, 0, e.what());
        }
        return internal_error();
    }
}

}  // namespace tollgate::gateway
