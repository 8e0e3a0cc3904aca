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

// Tollgate HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

namespace tollgate::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

// Response helper methods

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            return hdr_value;
        }
    }
    return default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return std::any_of(headers.begin(), headers.end(), [name](const OwnedHeader& header) {
        return header_name_equals(header.first, name);
    });
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_text(std::string_view text) {
    body.assign(text);
    add_header("Content-Type", "text/plain; charset=utf-8");
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }

    return true;
}

// Representability policies

namespace {

// tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
//         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
constexpr bool is_tchar(unsigned char c) noexcept {
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

}  // namespace

bool is_token(std::string_view str) noexcept {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](char c) { return is_tchar(static_cast<unsigned char>(c)); });
}

bool is_text_header_value(std::string_view value) noexcept {
    return std::all_of(value.begin(), value.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c == '\t' || (c >= 0x20 && c < 0x7F);
    });
}

bool is_representable_header(std::string_view name, std::string_view value) noexcept {
    return is_token(name) && is_text_header_value(value);
}

std::string_view outbound_method(std::string_view method) noexcept {
    return is_token(method) ? method : std::string_view("GET");
}

StatusCode map_status(int code) noexcept {
    if (code < 100 || code > 999) {
        return StatusCode::OK;
    }
    return static_cast<StatusCode>(code);
}

std::optional<UrlParts> split_url(std::string_view url) {
    constexpr std::string_view kHttp = "http://";
    constexpr std::string_view kHttps = "https://";

    size_t scheme_len = 0;
    if (url.starts_with(kHttp)) {
        scheme_len = kHttp.size();
    } else if (url.starts_with(kHttps)) {
        scheme_len = kHttps.size();
    } else {
        return std::nullopt;
    }

    size_t path_pos = url.find('/', scheme_len);
    std::string_view authority = url.substr(scheme_len, path_pos - scheme_len);
    if (authority.empty()) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.origin = std::string(url.substr(0, scheme_len + authority.size()));
    parts.target = path_pos == std::string_view::npos ? std::string("/")
                                                      : std::string(url.substr(path_pos));
    return parts;
}

}  // namespace tollgate::http
