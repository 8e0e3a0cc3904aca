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


// Tollgate Proxy Handler - Implementation

#include "proxy_handler.hpp"

#include <chrono>

namespace tollgate::gateway {

ProxyHandler::ProxyHandler(std::shared_ptr<const ProxyState> state, Pipeline pipeline,
                           quill::Logger* logger)
    : pipeline_(std::move(pipeline)),
      forwarder_(std::move(state)),
      mapper_(logger),
      logger_(logger) {}

http::Response ProxyHandler::handle(const http::Request& request) const {
    http::Response response;

    RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.start_time = std::chrono::steady_clock::now();

    auto result = pipeline_.execute_request(ctx);

    if (result == MiddlewareResult::Continue) {
        std::error_code error;
        auto upstream = forwarder_.forward(request, error);
        response = mapper_.map(std::move(upstream), error, ctx.correlation_id);
    } else if (result == MiddlewareResult::Error) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Request pipeline failed", ctx.correlation_id, 0,
                          ctx.error_message);
        }
        response = ResponseMapper::internal_error();
    }

    ResponseContext response_ctx;
    response_ctx.request = &request;
    response_ctx.response = &response;
    response_ctx.correlation_id = ctx.correlation_id;
    response_ctx.start_time = ctx.start_time;
    (void)pipeline_.execute_response(response_ctx);

    return response;
}

}  // namespace tollgate::gateway
