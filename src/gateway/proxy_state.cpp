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


// Tollgate Proxy State - Implementation

#include "proxy_state.hpp"

#include <stdexcept>

namespace tollgate::gateway {

std::string_view trim_trailing_slashes(std::string_view url) noexcept {
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    return url;
}

ProxyState::ProxyState(std::vector<std::string> keys, std::string_view base_url,
                       std::shared_ptr<UpstreamTransport> transport)
    : keys_(std::move(keys)),
      base_url_(trim_trailing_slashes(base_url)),
      transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("ProxyState requires an upstream transport");
    }
}

}  // namespace tollgate::gateway
