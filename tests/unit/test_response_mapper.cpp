// Tollgate Response Mapper Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/gateway/forwarder.hpp"
#include "../../src/gateway/response_mapper.hpp"
#include "test_support.hpp"

using namespace tollgate::gateway;
using namespace tollgate::http;

TEST_CASE("Upstream response is relayed", "[mapper]") {
    ResponseMapper mapper(tollgate::test::test_logger());

    UpstreamResponse upstream;
    upstream.status = 404;
    upstream.headers = {{"Content-Type", "application/json"},
                        {"X-Binary", "\x80\x81"},
                        {"Set-Cookie", "a=1"},
                        {"Set-Cookie", "b=2"}};
    upstream.body = R"({"error":"model not found"})";

    auto response = mapper.map(std::move(upstream), {}, "cid");

    REQUIRE(to_int(response.status) == 404);
    REQUIRE(response.body == R"({"error":"model not found"})");
    REQUIRE(response.headers.size() == 3);
    REQUIRE(response.headers[0] == OwnedHeader{"Content-Type", "application/json"});
    REQUIRE(response.headers[1] == OwnedHeader{"Set-Cookie", "a=1"});
    REQUIRE(response.headers[2] == OwnedHeader{"Set-Cookie", "b=2"});
}

TEST_CASE("Upstream error statuses are data, not failures", "[mapper]") {
    UpstreamResponse upstream;
    upstream.status = 500;
    upstream.body = "upstream exploded";

    auto response = ResponseMapper::map_upstream(std::move(upstream));
    REQUIRE(response.status == StatusCode::InternalServerError);
    REQUIRE(response.body == "upstream exploded");
}

TEST_CASE("Out-of-range status falls back to 200", "[mapper]") {
    UpstreamResponse upstream;
    upstream.status = 1200;
    upstream.body = "x";

    auto response = ResponseMapper::map_upstream(std::move(upstream));
    REQUIRE(response.status == StatusCode::OK);
    REQUIRE(response.body == "x");
}

TEST_CASE("Large upstream body is not capped", "[mapper]") {
    UpstreamResponse upstream;
    upstream.status = 200;
    upstream.body.assign(kMaxBodySize + 1024, 'z');

    auto response = ResponseMapper::map_upstream(std::move(upstream));
    REQUIRE(response.body.size() == kMaxBodySize + 1024);
}

TEST_CASE("Transport failure maps to 502", "[mapper]") {
    ResponseMapper mapper(tollgate::test::test_logger());

    auto response =
        mapper.map(std::nullopt, make_transport_error(httplib::Error::Connection), "cid");

    REQUIRE(response.status == StatusCode::BadGateway);
    REQUIRE(response.body == kUpstreamFailedBody);
    REQUIRE(response.get_header("Content-Type") == "text/plain; charset=utf-8");
}

TEST_CASE("Internal error is an empty 500", "[mapper]") {
    auto response = ResponseMapper::internal_error();
    REQUIRE(response.status == StatusCode::InternalServerError);
    REQUIRE(response.body.empty());
    REQUIRE(response.headers.empty());
}

TEST_CASE("Transport error category", "[mapper][upstream]") {
    auto error = make_transport_error(httplib::Error::Read);
    REQUIRE(std::string(error.category().name()) == "transport");
    REQUIRE(error.message() == httplib::to_string(httplib::Error::Read));

    // A failed result never carries Success
    REQUIRE(make_transport_error(httplib::Error::Success).value() ==
            static_cast<int>(httplib::Error::Unknown));
}

TEST_CASE("Framing headers", "[mapper][upstream]") {
    REQUIRE(is_framing_header("Content-Length"));
    REQUIRE(is_framing_header("transfer-encoding"));
    REQUIRE_FALSE(is_framing_header("Content-Type"));
}
