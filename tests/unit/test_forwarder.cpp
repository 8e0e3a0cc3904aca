// Tollgate Request Forwarder Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

#include "../../src/gateway/forwarder.hpp"
#include "test_support.hpp"

using namespace tollgate::gateway;
using namespace tollgate::http;
using tollgate::test::find_owned;
using tollgate::test::OwnedRequest;
using tollgate::test::RecordingTransport;

TEST_CASE("Target URL construction", "[forwarder]") {
    REQUIRE(build_target_url("http://127.0.0.1:11434", "chat/completions") ==
            "http://127.0.0.1:11434/v1/chat/completions");
    REQUIRE(build_target_url("http://host/prefix", "models") == "http://host/prefix/v1/models");
    REQUIRE(build_target_url("http://host", "") == "http://host/v1/");
}

TEST_CASE("Forwarded header policy", "[forwarder]") {
    REQUIRE_FALSE(is_forwarded_header("Host", "proxy:3000"));
    REQUIRE_FALSE(is_forwarded_header("host", "proxy:3000"));
    REQUIRE_FALSE(is_forwarded_header("Authorization", "Bearer secret"));
    REQUIRE_FALSE(is_forwarded_header("X-Binary", "\xFF\xFE"));
    REQUIRE(is_forwarded_header("Content-Type", "application/json"));
    REQUIRE(is_forwarded_header("Proxy-Authorization", "Basic x"));
}

TEST_CASE("Outbound request construction", "[forwarder]") {
    OwnedRequest owned;
    owned.method = "POST";
    owned.suffix = "chat/completions";
    owned.body = R"({"model":"llama3","messages":[]})";
    owned.with_header("Host", "proxy.local:3000")
        .with_bearer("secret")
        .with_header("Content-Type", "application/json")
        .with_header("X-Request-Id", "abc")
        .with_header("X-Latin1", "caf\xE9")
        .with_header("Accept", "text/event-stream")
        .with_header("Accept", "application/json");

    auto outbound = build_outbound_request(owned.view(), "http://127.0.0.1:11434");

    REQUIRE(outbound.method == "POST");
    REQUIRE(outbound.url == "http://127.0.0.1:11434/v1/chat/completions");
    REQUIRE(outbound.body == owned.body);

    REQUIRE(find_owned(outbound.headers, "host") == nullptr);
    REQUIRE(find_owned(outbound.headers, "authorization") == nullptr);
    REQUIRE(find_owned(outbound.headers, "x-latin1") == nullptr);

    // Order and duplicates are preserved
    REQUIRE(outbound.headers.size() == 4);
    REQUIRE(outbound.headers[0] == OwnedHeader{"Content-Type", "application/json"});
    REQUIRE(outbound.headers[1] == OwnedHeader{"X-Request-Id", "abc"});
    REQUIRE(outbound.headers[2] == OwnedHeader{"Accept", "text/event-stream"});
    REQUIRE(outbound.headers[3] == OwnedHeader{"Accept", "application/json"});
}

TEST_CASE("Unrepresentable method becomes GET", "[forwarder]") {
    OwnedRequest owned;
    owned.method = "NOT A TOKEN";
    auto outbound = build_outbound_request(owned.view(), "http://host");
    REQUIRE(outbound.method == "GET");

    OwnedRequest custom;
    custom.method = "PURGE";
    REQUIRE(build_outbound_request(custom.view(), "http://host").method == "PURGE");
}

TEST_CASE("Binary body is copied byte for byte", "[forwarder]") {
    OwnedRequest owned;
    owned.method = "PUT";
    owned.body = std::string("\x00\x01\xFF\r\n", 5);
    auto outbound = build_outbound_request(owned.view(), "http://host");
    REQUIRE(outbound.body.size() == 5);
    REQUIRE(outbound.body == owned.body);
}

TEST_CASE("RequestForwarder sends exactly one request", "[forwarder]") {
    auto transport = std::make_shared<RecordingTransport>();
    transport->reply_with(201, "created", {{"X-Upstream", "yes"}});
    auto state = std::make_shared<const ProxyState>(std::vector<std::string>{"k"},
                                                    "http://127.0.0.1:11434///", transport);
    RequestForwarder forwarder(state);

    OwnedRequest owned;
    owned.method = "POST";
    owned.suffix = "embeddings";
    owned.body = "{}";

    std::error_code error;
    auto response = forwarder.forward(owned.view(), error);

    REQUIRE_FALSE(error);
    REQUIRE(response.has_value());
    REQUIRE(response->status == 201);
    REQUIRE(response->body == "created");
    REQUIRE(transport->call_count() == 1);
    REQUIRE(transport->last_call().url == "http://127.0.0.1:11434/v1/embeddings");
}

TEST_CASE("RequestForwarder reports transport failure", "[forwarder]") {
    auto transport = std::make_shared<RecordingTransport>();
    transport->fail_with(make_transport_error(httplib::Error::Connection));
    auto state = std::make_shared<const ProxyState>(std::vector<std::string>{"k"},
                                                    "http://127.0.0.1:1", transport);
    RequestForwarder forwarder(state);

    OwnedRequest owned;
    std::error_code error;
    auto response = forwarder.forward(owned.view(), error);

    REQUIRE_FALSE(response.has_value());
    REQUIRE(error);
    REQUIRE(error.category() == transport_category());
    REQUIRE(transport->call_count() == 1);
}

TEST_CASE("ProxyState normalizes the base URL", "[forwarder][state]") {
    auto transport = std::make_shared<RecordingTransport>();

    ProxyState state({"a", "b"}, "http://host:11434/", transport);
    REQUIRE(state.base_url() == "http://host:11434");
    REQUIRE(state.keys().size() == 2);

    REQUIRE(trim_trailing_slashes("http://host//") == "http://host");
    REQUIRE(trim_trailing_slashes("http://host") == "http://host");

    REQUIRE_THROWS_AS(ProxyState({}, "http://host", nullptr), std::invalid_argument);
}
