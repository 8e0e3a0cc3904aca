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


// Tollgate Gateway - Upstream Client Pool Implementation

#include "connection_pool.hpp"

#include <algorithm>

namespace tollgate::gateway {

UpstreamClientPool::UpstreamClientPool(size_t max_size, std::chrono::seconds max_idle)
    : max_size_(max_size), max_idle_(max_idle) {
    pool_.reserve(max_size);
}

UpstreamClientPool::~UpstreamClientPool() {
    clear();
}

std::unique_ptr<httplib::Client> UpstreamClientPool::make_client(const std::string& origin) {
    auto client = std::make_unique<httplib::Client>(origin);
    if (!client->is_valid()) {
        return nullptr;
    }

    // Bodies and redirects are relayed to the caller untouched
    client->set_keep_alive(true);
    client->set_follow_location(false);
    client->set_decompress(false);
    return client;
}

std::unique_ptr<httplib::Client> UpstreamClientPool::acquire(const std::string& origin) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_stale_locked();

        // Search from back to front (LIFO - most recently used first)
        for (auto it = pool_.rbegin(); it != pool_.rend(); ++it) {
            if (it->origin == origin) {
                auto client = std::move(it->client);
                pool_.erase(std::next(it).base());
                ++hits_;
                return client;
            }
        }
        ++misses_;
    }

    // Construct outside the lock (may allocate an SSL context)
    return make_client(origin);
}

void UpstreamClientPool::release(const std::string& origin,
                                 std::unique_ptr<httplib::Client> client, bool reusable) {
    if (!client) {
        return;
    }
    if (!reusable) {
        client->stop();
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (pool_.size() >= max_size_) {
        ++pool_full_closes_;
        lock.unlock();
        client->stop();
        return;
    }

    PooledClient pooled;
    pooled.client = std::move(client);
    pooled.origin = origin;
    pooled.last_used = std::chrono::steady_clock::now();
    pool_.push_back(std::move(pooled));
}

void UpstreamClientPool::cleanup_stale() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_stale_locked();
}

void UpstreamClientPool::cleanup_stale_locked() {
    auto before = pool_.size();
    pool_.erase(std::remove_if(pool_.begin(), pool_.end(),
                               [this](const PooledClient& pooled) {
                                   return pooled.is_stale(max_idle_);
                               }),
                pool_.end());
    evictions_ += before - pool_.size();
}

void UpstreamClientPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.clear();
}

size_t UpstreamClientPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}

size_t UpstreamClientPool::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t UpstreamClientPool::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t UpstreamClientPool::pool_full_closes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_full_closes_;
}

size_t UpstreamClientPool::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

double UpstreamClientPool::hit_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto total = hits_ + misses_;
    return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
}

void UpstreamClientPool::log_stats(quill::Logger* logger) const {
    if (!logger) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto total_requests = hits_ + misses_;
    if (total_requests == 0) {
        LOG_INFO(logger, "[POOL] No requests processed yet");
        return;
    }

    LOG_INFO(logger,
             "[POOL] Stats: size={}/{}, hits={}, misses={}, hit_rate={:.2f}%, "
             "pool_full_closes={}, evictions={}",
             pool_.size(), max_size_, hits_, misses_,
             static_cast<double>(hits_) * 100.0 / static_cast<double>(total_requests),
             pool_full_closes_, evictions_);
}

}  // namespace tollgate::gateway
