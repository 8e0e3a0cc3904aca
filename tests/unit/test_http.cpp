// Tollgate HTTP Value Types Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/http/http.hpp"

using namespace tollgate::http;

TEST_CASE("Header names compare case-insensitively", "[http]") {
    REQUIRE(header_name_equals("Authorization", "authorization"));
    REQUIRE(header_name_equals("HOST", "host"));
    REQUIRE_FALSE(header_name_equals("Host", "Hosts"));
    REQUIRE_FALSE(header_name_equals("x-a", "x-b"));
}

TEST_CASE("Request header lookup", "[http]") {
    Request request;
    request.headers.push_back({"Content-Type", "application/json"});
    request.headers.push_back({"X-Trace", "first"});
    request.headers.push_back({"x-trace", "second"});

    SECTION("find_header returns the first match") {
        const auto* header = request.find_header("X-TRACE");
        REQUIRE(header != nullptr);
        REQUIRE(header->value == "first");
    }

    SECTION("get_header falls back to default") {
        REQUIRE(request.get_header("content-type") == "application/json");
        REQUIRE(request.get_header("accept", "*/*") == "*/*");
        REQUIRE_FALSE(request.has_header("accept"));
    }
}

TEST_CASE("Response helpers", "[http]") {
    Response response;
    REQUIRE(response.status == StatusCode::OK);

    response.add_header("X-One", "1");
    response.add_header("x-one", "2");
    REQUIRE(response.headers.size() == 2);
    REQUIRE(response.get_header("X-ONE") == "1");

    response.set_text("Unauthorized");
    REQUIRE(response.body == "Unauthorized");
    REQUIRE(response.get_header("content-type") == "text/plain; charset=utf-8");
}

TEST_CASE("Token validation", "[http]") {
    REQUIRE(is_token("GET"));
    REQUIRE(is_token("PROPFIND"));
    REQUIRE(is_token("X-Custom_Header"));
    REQUIRE_FALSE(is_token(""));
    REQUIRE_FALSE(is_token("GET POST"));
    REQUIRE_FALSE(is_token("B\xC3\xA4" "D"));
    REQUIRE_FALSE(is_token("a:b"));
}

TEST_CASE("Header value representability", "[http]") {
    REQUIRE(is_text_header_value("Bearer abc123"));
    REQUIRE(is_text_header_value("a\tb"));
    REQUIRE(is_text_header_value(""));
    REQUIRE_FALSE(is_text_header_value("caf\xC3\xA9"));
    REQUIRE_FALSE(is_text_header_value(std::string_view("nul\0byte", 8)));
    REQUIRE_FALSE(is_text_header_value("line\nbreak"));
    REQUIRE_FALSE(is_text_header_value("del\x7F"));

    REQUIRE(is_representable_header("X-Ok", "value"));
    REQUIRE_FALSE(is_representable_header("Bad Name", "value"));
    REQUIRE_FALSE(is_representable_header("X-Bin", "\x01\x02"));
}

TEST_CASE("Outbound method falls back to GET", "[http]") {
    REQUIRE(outbound_method("POST") == "POST");
    REQUIRE(outbound_method("PROPFIND") == "PROPFIND");
    REQUIRE(outbound_method("") == "GET");
    REQUIRE(outbound_method("BAD METHOD") == "GET");
}

TEST_CASE("Status mapping falls back to 200", "[http]") {
    REQUIRE(to_int(map_status(404)) == 404);
    REQUIRE(to_int(map_status(418)) == 418);
    REQUIRE(to_int(map_status(100)) == 100);
    REQUIRE(to_int(map_status(999)) == 999);
    REQUIRE(map_status(99) == StatusCode::OK);
    REQUIRE(map_status(1000) == StatusCode::OK);
    REQUIRE(map_status(-1) == StatusCode::OK);
}

TEST_CASE("URL splitting", "[http]") {
    SECTION("Origin only") {
        auto parts = split_url("http://127.0.0.1:11434");
        REQUIRE(parts.has_value());
        REQUIRE(parts->origin == "http://127.0.0.1:11434");
        REQUIRE(parts->target == "/");
    }

    SECTION("Path prefix is kept in the target") {
        auto parts = split_url("https://gpu.internal/ollama/v1/chat");
        REQUIRE(parts.has_value());
        REQUIRE(parts->origin == "https://gpu.internal");
        REQUIRE(parts->target == "/ollama/v1/chat");
    }

    SECTION("Rejected URLs") {
        REQUIRE_FALSE(split_url("ftp://host/file").has_value());
        REQUIRE_FALSE(split_url("http://").has_value());
        REQUIRE_FALSE(split_url("http:///v1").has_value());
        REQUIRE_FALSE(split_url("localhost:11434").has_value());
    }
}
