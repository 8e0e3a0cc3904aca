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


// Tollgate Request Forwarder - Implementation

#include "forwarder.hpp"

namespace tollgate::gateway {

std::string build_target_url(std::string_view base_url, std::string_view path_suffix) {
    std::string url;
    url.reserve(base_url.size() + kRoutePrefix.size() + path_suffix.size());
    url.append(base_url);
    url.append(kRoutePrefix);
    url.append(path_suffix);
    return url;
}

bool is_forwarded_header(std::string_view name, std::string_view value) noexcept {
    if (http::header_name_equals(name, http::kHostHeader) ||
        http::header_name_equals(name, http::kAuthorizationHeader)) {
        return false;
    }
    return http::is_representable_header(name, value);
}

OutboundRequest build_outbound_request(const http::Request& request, std::string_view base_url) {
    OutboundRequest outbound;
    outbound.method = std::string(http::outbound_method(request.method));
    outbound.url = build_target_url(base_url, request.path_suffix);

    outbound.headers.reserve(request.headers.size());
    for (const auto& header : request.headers) {
        if (is_forwarded_header(header.name, header.value)) {
            outbound.headers.emplace_back(std::string(header.name), std::string(header.value));
        }
    }

    outbound.body = std::string(request.body);
    return outbound;
}

std::optional<UpstreamResponse> RequestForwarder::forward(const http::Request& request,
                                                          std::error_code& error_out) const {
    auto outbound = build_outbound_request(request, state_->base_url());
    return state_->transport().send(outbound, error_out);
}

}  // namespace tollgate::gateway
