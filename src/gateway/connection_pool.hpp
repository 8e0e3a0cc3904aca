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


// Tollgate Gateway - Upstream Client Pool
// Shared pool of keep-alive cpp-httplib clients for the inference service

#pragma once

#include <httplib.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/logging.hpp"

namespace tollgate::gateway {

/// Idle client parked in the pool
struct PooledClient {
    std::unique_ptr<httplib::Client> client;
    std::string origin;  // scheme://host[:port]
    std::chrono::steady_clock::time_point last_used;

    /// Check if client has been idle too long
    [[nodiscard]] bool is_stale(std::chrono::seconds max_idle) const noexcept {
        auto now = std::chrono::steady_clock::now();
        return (now - last_used) > max_idle;
    }
};

/// Upstream client pool (LIFO stack, mutex-guarded, shared by all workers)
///
/// An httplib::Client serializes its requests, so each in-flight request owns one
/// client exclusively between acquire() and release().
class UpstreamClientPool {
public:
    /// @param max_size Maximum number of idle clients kept
    /// @param max_idle Idle time after which a parked client is evicted
    explicit UpstreamClientPool(size_t max_size = 64,
                                std::chrono::seconds max_idle = std::chrono::seconds(60));

    UpstreamClientPool(const UpstreamClientPool&) = delete;
    UpstreamClientPool& operator=(const UpstreamClientPool&) = delete;

    ~UpstreamClientPool();

    /// Take an idle client for origin, or create a new one
    /// Returns nullptr if origin cannot be turned into a client
    [[nodiscard]] std::unique_ptr<httplib::Client> acquire(const std::string& origin);

    /// Park a client after use; closes it if the pool is full or it is not reusable
    void release(const std::string& origin, std::unique_ptr<httplib::Client> client,
                 bool reusable);

    /// Remove clients idle longer than max_idle
    void cleanup_stale();

    /// Close all parked clients
    void clear();

    // Statistics
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }
    [[nodiscard]] size_t hits() const;
    [[nodiscard]] size_t misses() const;
    [[nodiscard]] size_t pool_full_closes() const;
    [[nodiscard]] size_t evictions() const;
    [[nodiscard]] double hit_rate() const;

    /// Log pool statistics
    void log_stats(quill::Logger* logger) const;

private:
    [[nodiscard]] static std::unique_ptr<httplib::Client> make_client(const std::string& origin);
    void cleanup_stale_locked();

    mutable std::mutex mutex_;
    std::vector<PooledClient> pool_;  // LIFO stack (back = top)
    size_t max_size_;
    std::chrono::seconds max_idle_;

    // Statistics
    size_t hits_ = 0;              // Reused parked client
    size_t misses_ = 0;            // Created new client
    size_t pool_full_closes_ = 0;  // Closes due to pool being full
    size_t evictions_ = 0;         // Idle clients closed by cleanup
};

}  // namespace tollgate::gateway
