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


// Tollgate Key Sources - Header
// Strategies resolving the set of accepted API keys at startup

#pragma once

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "config.hpp"

namespace tollgate::control {

/// Key source error codes
enum class KeySourceErrc {
    IoError = 1,     // File or database could not be opened/read
    ParseError = 2,  // Key contains bytes that cannot appear in a header value
    QueryError = 3,  // SQL statement failed or returned a NULL key
};

/// Error category for key source failures
class KeySourceErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "key_source"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get key source error category singleton
[[nodiscard]] const KeySourceErrorCategory& key_source_category() noexcept;

[[nodiscard]] std::error_code make_key_source_error(KeySourceErrc e) noexcept;

/// Resolves the accepted key set once
class KeySource {
public:
    virtual ~KeySource() = default;

    /// Returns the keys in source order, or nullopt with error_out set
    [[nodiscard]] virtual std::optional<std::vector<std::string>> resolve_keys(
        std::error_code& error_out) const = 0;

    /// Human-readable origin for diagnostics ("file '/etc/keys'")
    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Explicit key list (CLI, config file or API_KEYS)
class ListKeySource : public KeySource {
public:
    explicit ListKeySource(std::vector<std::string> keys) : keys_(std::move(keys)) {}

    [[nodiscard]] std::optional<std::vector<std::string>> resolve_keys(
        std::error_code& error_out) const override;

    [[nodiscard]] std::string describe() const override { return "key list"; }

private:
    std::vector<std::string> keys_;
};

/// Key file; entries separated by ',', '\n' or '\r'
class FileKeySource : public KeySource {
public:
    explicit FileKeySource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] std::optional<std::vector<std::string>> resolve_keys(
        std::error_code& error_out) const override;

    [[nodiscard]] std::string describe() const override { return "file '" + path_ + "'"; }

private:
    std::string path_;
};

/// sqlite3 handle deleter for std::unique_ptr
struct SqliteDeleter {
    void operator()(sqlite3* db) const noexcept {
        if (db) {
            sqlite3_close(db);
        }
    }
};

/// sqlite3_stmt deleter for std::unique_ptr
struct SqliteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using SqlitePtr = std::unique_ptr<sqlite3, SqliteDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

/// SQLite database with table api_keys(key TEXT), opened read-only
class SqliteKeySource : public KeySource {
public:
    explicit SqliteKeySource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] std::optional<std::vector<std::string>> resolve_keys(
        std::error_code& error_out) const override;

    [[nodiscard]] std::string describe() const override {
        return "sqlite database '" + path_ + "'";
    }

private:
    std::string path_;
};

/// Pick exactly one strategy: sqlite > file > list (empty list when none is set)
[[nodiscard]] std::unique_ptr<KeySource> make_key_source(const KeysConfig& config);

}  // namespace tollgate::control
