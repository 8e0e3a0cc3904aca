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


// Gateway Component Factory - Implementation

#include "factory.hpp"

#include <chrono>

#include "auth_middleware.hpp"
#include "forwarder.hpp"

namespace tollgate::gateway {

std::shared_ptr<HttpClientTransport> build_transport(const control::Config& config) {
    auto pool = std::make_shared<UpstreamClientPool>(
        config.upstream.pool_size, std::chrono::seconds(config.upstream.pool_idle_timeout));
    return std::make_shared<HttpClientTransport>(std::move(pool));
}

std::shared_ptr<const ProxyState> build_proxy_state(const control::Config& config,
                                                    std::vector<std::string> keys,
                                                    std::shared_ptr<UpstreamTransport> transport) {
    return std::make_shared<const ProxyState>(std::move(keys), config.upstream.url,
                                              std::move(transport));
}

Pipeline build_pipeline(const control::Config& config, std::shared_ptr<const ProxyState> state,
                        quill::Logger* logger) {
    Pipeline pipeline;

    // Order matters: an unauthenticated request is rejected before its body is judged
    pipeline.use(std::make_unique<ApiKeyAuthMiddleware>(std::move(state), logger));
    pipeline.use(std::make_unique<BodyLimitMiddleware>(kMaxBodySize));

    if (config.logging.log_requests) {
        pipeline.use(std::make_unique<LoggingMiddleware>(logger, config.logging.exclude_paths));
    }

    return pipeline;
}

std::unique_ptr<ProxyHandler> build_proxy_handler(const control::Config& config,
                                                  std::shared_ptr<const ProxyState> state,
                                                  quill::Logger* logger) {
    auto pipeline = build_pipeline(config, state, logger);
    return std::make_unique<ProxyHandler>(std::move(state), std::move(pipeline), logger);
}

}  // namespace tollgate::gateway
