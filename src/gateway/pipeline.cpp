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


// Tollgate Pipeline - Implementation

#include "pipeline.hpp"

namespace tollgate::gateway {

// BodyLimitMiddleware implementation (Request phase)

MiddlewareResult BodyLimitMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    if (ctx.request->body_status == http::BodyStatus::Complete &&
        ctx.request->body.size() <= max_body_size_) {
        return MiddlewareResult::Continue;
    }

    ctx.response->status = http::StatusCode::BadRequest;
    ctx.response->set_text("Failed to read body");
    ctx.set_metadata("reject_reason", ctx.request->body_status == http::BodyStatus::ReadFailed
                                          ? "body_read_failed"
                                          : "body_too_large");
    return MiddlewareResult::Stop;
}

// LoggingMiddleware implementation (Response phase - logs with timing)

MiddlewareResult LoggingMiddleware::process_response(ResponseContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }
    if (!logger_ || exclude_paths_.contains(std::string(ctx.request->path))) {
        return MiddlewareResult::Continue;
    }

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - ctx.start_time);

    LOG_REQUEST(logger_, ctx.request->method, ctx.request->path,
                http::to_int(ctx.response->status), duration.count(), ctx.request->client_ip,
                ctx.correlation_id);

    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) const {
    for (const auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error || ctx.has_error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(ResponseContext& ctx) const {
    // Every middleware sees the final response, even after a Stop in the request phase
    for (const auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_response(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

}  // namespace tollgate::gateway
