// Tollgate Upstream Client Pool Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <thread>

#include "../../src/gateway/connection_pool.hpp"

using namespace tollgate::gateway;

namespace {
constexpr const char* kOrigin = "http://127.0.0.1:11434";
}

TEST_CASE("Pool reuses released clients", "[pool]") {
    UpstreamClientPool pool(4);

    auto client = pool.acquire(kOrigin);
    REQUIRE(client != nullptr);
    REQUIRE(pool.misses() == 1);
    REQUIRE(pool.hits() == 0);

    auto* raw = client.get();
    pool.release(kOrigin, std::move(client), true);
    REQUIRE(pool.size() == 1);

    auto again = pool.acquire(kOrigin);
    REQUIRE(again.get() == raw);
    REQUIRE(pool.hits() == 1);
    REQUIRE(pool.size() == 0);
    REQUIRE(pool.hit_rate() == 0.5);
}

TEST_CASE("Pool keys clients by origin", "[pool]") {
    UpstreamClientPool pool(4);
    pool.release(kOrigin, pool.acquire(kOrigin), true);

    auto other = pool.acquire("http://127.0.0.1:8080");
    REQUIRE(other != nullptr);
    REQUIRE(pool.misses() == 2);
    REQUIRE(pool.size() == 1);
}

TEST_CASE("Non-reusable clients are not parked", "[pool]") {
    UpstreamClientPool pool(4);
    pool.release(kOrigin, pool.acquire(kOrigin), false);
    REQUIRE(pool.size() == 0);

    pool.release(kOrigin, nullptr, true);
    REQUIRE(pool.size() == 0);
}

TEST_CASE("Full pool closes extra clients", "[pool]") {
    UpstreamClientPool pool(1);
    auto first = pool.acquire(kOrigin);
    auto second = pool.acquire(kOrigin);

    pool.release(kOrigin, std::move(first), true);
    pool.release(kOrigin, std::move(second), true);

    REQUIRE(pool.size() == 1);
    REQUIRE(pool.pool_full_closes() == 1);
}

TEST_CASE("Idle clients are evicted", "[pool]") {
    UpstreamClientPool pool(4, std::chrono::seconds(0));
    pool.release(kOrigin, pool.acquire(kOrigin), true);
    REQUIRE(pool.size() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    pool.cleanup_stale();
    REQUIRE(pool.size() == 0);
    REQUIRE(pool.evictions() == 1);

    pool.log_stats(nullptr);
}

TEST_CASE("Unsupported scheme yields no client", "[pool]") {
    UpstreamClientPool pool;
    REQUIRE(pool.acquire("ftp://127.0.0.1:21") == nullptr);
}
