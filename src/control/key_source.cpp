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


// Tollgate Key Sources - Implementation

#include "key_source.hpp"

#include <fstream>
#include <sstream>

#include "../http/http.hpp"

namespace tollgate::control {

std::string KeySourceErrorCategory::message(int ev) const {
    switch (static_cast<KeySourceErrc>(ev)) {
        case KeySourceErrc::IoError:
            return "cannot read key source";
        case KeySourceErrc::ParseError:
            return "key contains characters not allowed in a header value";
        case KeySourceErrc::QueryError:
            return "key query failed";
    }
    return "unknown key source error";
}

const KeySourceErrorCategory& key_source_category() noexcept {
    static KeySourceErrorCategory instance;
    return instance;
}

std::error_code make_key_source_error(KeySourceErrc e) noexcept {
    return {static_cast<int>(e), key_source_category()};
}

namespace {

std::string_view trim(std::string_view value) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    size_t start = value.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = value.find_last_not_of(kWhitespace);
    return value.substr(start, end - start + 1);
}

}  // namespace

std::optional<std::vector<std::string>> ListKeySource::resolve_keys(
    std::error_code& error_out) const {
    error_out.clear();

    std::vector<std::string> keys;
    keys.reserve(keys_.size());
    for (const auto& key : keys_) {
        auto trimmed = trim(key);
        if (!trimmed.empty()) {
            keys.emplace_back(trimmed);
        }
    }
    return keys;
}

std::optional<std::vector<std::string>> FileKeySource::resolve_keys(
    std::error_code& error_out) const {
    std::ifstream file{path_, std::ios::binary};
    if (!file.is_open()) {
        error_out = make_key_source_error(KeySourceErrc::IoError);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error_out = make_key_source_error(KeySourceErrc::IoError);
        return std::nullopt;
    }
    std::string content = buffer.str();
    std::string_view view{content};

    std::vector<std::string> keys;
    size_t pos = 0;
    while (pos <= view.size()) {
        size_t sep = view.find_first_of(",\n\r", pos);
        if (sep == std::string_view::npos) {
            sep = view.size();
        }
        auto entry = trim(view.substr(pos, sep - pos));
        if (!entry.empty()) {
            // Such a key could never match an authorization header
            if (!http::is_text_header_value(entry)) {
                error_out = make_key_source_error(KeySourceErrc::ParseError);
                return std::nullopt;
            }
            keys.emplace_back(entry);
        }
        pos = sep + 1;
    }

    error_out.clear();
    return keys;
}

std::optional<std::vector<std::string>> SqliteKeySource::resolve_keys(
    std::error_code& error_out) const {
    sqlite3* raw_db = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw_db, SQLITE_OPEN_READONLY, nullptr);
    SqlitePtr db{raw_db};  // sqlite3_open_v2 allocates a handle even on failure
    if (rc != SQLITE_OK) {
        error_out = make_key_source_error(KeySourceErrc::IoError);
        return std::nullopt;
    }

    sqlite3_stmt* raw_stmt = nullptr;
    rc = sqlite3_prepare_v2(db.get(), "SELECT key FROM api_keys", -1, &raw_stmt, nullptr);
    SqliteStmtPtr stmt{raw_stmt};
    if (rc != SQLITE_OK) {
        error_out = make_key_source_error(KeySourceErrc::QueryError);
        return std::nullopt;
    }

    std::vector<std::string> keys;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (text == nullptr) {
            error_out = make_key_source_error(KeySourceErrc::QueryError);
            return std::nullopt;
        }
        int length = sqlite3_column_bytes(stmt.get(), 0);
        std::string_view key{reinterpret_cast<const char*>(text), static_cast<size_t>(length)};
        if (!http::is_text_header_value(key)) {
            error_out = make_key_source_error(KeySourceErrc::ParseError);
            return std::nullopt;
        }
        keys.emplace_back(key);
    }

    if (rc != SQLITE_DONE) {
        error_out = make_key_source_error(KeySourceErrc::QueryError);
        return std::nullopt;
    }

    error_out.clear();
    return keys;
}

std::unique_ptr<KeySource> make_key_source(const KeysConfig& config) {
    if (config.sqlite) {
        return std::make_unique<SqliteKeySource>(*config.sqlite);
    }
    if (config.file) {
        return std::make_unique<FileKeySource>(*config.file);
    }
    return std::make_unique<ListKeySource>(config.list.value_or(std::vector<std::string>{}));
}

}  // namespace tollgate::control
