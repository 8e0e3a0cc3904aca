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

// Tollgate Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#include "../control/config.hpp"

namespace tollgate::logging {

void init_logging_system() {
    quill::Backend::start();
}

static quill::LogLevel parse_log_level(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level == "warning" || level == "warn") {
        return quill::LogLevel::Warning;
    }
    if (level == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    quill::Logger* logger = nullptr;
    std::string logger_name{kLoggerName};

    if (log_config.output.empty() || log_config.output == "stdout") {
        auto console_sink =
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>("tollgate_console");
        logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        std::string log_path = fmt::format("{}/tollgate.log", log_config.output);

        if (log_config.format == "json") {
            auto json_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(json_sink));
        } else {
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(file_sink));
        }
    }

    logger->set_log_level(parse_log_level(log_config.level));
    return logger;
}

void shutdown_logging() {
    quill::Backend::stop();
}

// Generate base UUID v4 (called once per thread)
static std::string generate_base_uuid() {
    // XOR combines hardware randomness with timestamp for thread-unique seed
    std::mt19937 rng(std::random_device{}() ^
                     static_cast<uint32_t>(
                         std::chrono::steady_clock::now().time_since_epoch().count()));
    std::uniform_int_distribution<uint32_t> dist;

    std::array<uint8_t, 16> uuid_bytes{};
    for (size_t i = 0; i < 16; i += 4) {
        uint32_t random_val = dist(rng);
        uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
        uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
        uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
        uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
    }

    // Set version to 4 (random UUID)
    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
    // Set variant to RFC4122
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

    // Format as 8-4-4-4-12 string
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
    }

    return oss.str();
}

std::string generate_correlation_id() {
    // HTTP worker threads are long-lived; one random base per thread plus a counter
    static thread_local std::string base_uuid = generate_base_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = id.substr(0, hash_pos);
    std::string_view counter_part = id.substr(hash_pos + 1);

    // 36 characters: 8-4-4-4-12 with hyphens
    if (uuid_part.length() != 36) {
        return false;
    }

    if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
        uuid_part[23] != '-') {
        return false;
    }

    // Version nibble
    if (uuid_part[14] != '4') {
        return false;
    }

    // Variant nibble (8, 9, a, b)
    char variant = uuid_part[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
        variant != 'A' && variant != 'B') {
        return false;
    }

    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    for (size_t i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23)
            continue;
        if (!is_hex(uuid_part[i]))
            return false;
    }

    if (counter_part.empty()) {
        return false;
    }

    return std::all_of(counter_part.begin(), counter_part.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace tollgate::logging
