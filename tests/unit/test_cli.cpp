// Tollgate Command Line and Startup Resolution Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <map>

#include "../../src/runtime/orchestrator.hpp"

using namespace tollgate::runtime;
using tollgate::control::EnvLookup;
using tollgate::control::ValidationResult;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string(name));
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}  // namespace

TEST_CASE("Parse every override flag", "[cli]") {
    std::string error;
    auto options = parse_command_line({"--ollama-url", "http://example", "--api-keys", "a,b,c",
                                       "--api-keys-file", "/tmp/k", "--api-keys-sqlite",
                                       "/tmp/db", "--proxy-host", "1.2.3.4", "--proxy-port",
                                       "5555"},
                                      error);
    REQUIRE(options.has_value());
    REQUIRE(error.empty());

    const auto& overrides = options->overrides;
    REQUIRE(overrides.ollama_url == "http://example");
    REQUIRE(overrides.api_keys == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(overrides.api_keys_file == "/tmp/k");
    REQUIRE(overrides.api_keys_sqlite == "/tmp/db");
    REQUIRE(overrides.proxy_host == "1.2.3.4");
    REQUIRE(overrides.proxy_port == uint16_t{5555});
    REQUIRE_FALSE(options->show_help);
}

TEST_CASE("Parse --flag=value form and switches", "[cli]") {
    std::string error;
    auto options = parse_command_line(
        {"--config=/etc/tollgate.json", "--workers=4", "--log-level=debug", "-V"}, error);
    REQUIRE(options.has_value());
    REQUIRE(options->config_path == "/etc/tollgate.json");
    REQUIRE(options->overrides.worker_threads == 4u);
    REQUIRE(options->overrides.log_level == "debug");
    REQUIRE(options->show_version);

    auto help = parse_command_line({"--help"}, error);
    REQUIRE(help.has_value());
    REQUIRE(help->show_help);

    auto empty = parse_command_line({}, error);
    REQUIRE(empty.has_value());
    REQUIRE_FALSE(empty->overrides.api_keys.has_value());
}

TEST_CASE("Command line errors", "[cli]") {
    std::string error;

    REQUIRE_FALSE(parse_command_line({"--bogus", "1"}, error).has_value());
    REQUIRE(error.find("--bogus") != std::string::npos);

    REQUIRE_FALSE(parse_command_line({"--proxy-port"}, error).has_value());
    REQUIRE(error.find("Missing value") != std::string::npos);

    REQUIRE_FALSE(parse_command_line({"--proxy-port", "99999"}, error).has_value());
    REQUIRE_FALSE(parse_command_line({"--workers", "many"}, error).has_value());
    REQUIRE_FALSE(parse_command_line({"serve"}, error).has_value());
}

TEST_CASE("Command line wins over environment", "[cli][config]") {
    std::string error;
    auto options = parse_command_line({"--proxy-port", "7000", "--api-keys", "cli"}, error);
    REQUIRE(options.has_value());

    ValidationResult validation;
    auto config = resolve_config(*options,
                                 fake_env({{"PROXY_PORT", "6000"},
                                           {"PROXY_HOST", "127.0.0.1"},
                                           {"API_KEYS_FILE", "/etc/keys"}}),
                                 validation);
    REQUIRE(config.has_value());
    REQUIRE(config->server.listen_port == 7000);
    REQUIRE(config->server.listen_address == "127.0.0.1");
    REQUIRE_FALSE(config->keys.file.has_value());
    REQUIRE(config->keys.list == std::vector<std::string>{"cli"});
}

TEST_CASE("Config file is the lowest layer", "[cli][config]") {
    auto path = std::filesystem::temp_directory_path() / "tollgate_test_cli.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"listen_port": 4000}, "upstream": {"url": "http://file:1"}})";
    }

    CliOptions options;
    options.config_path = path.string();

    ValidationResult validation;
    auto config =
        resolve_config(options, fake_env({{"OLLAMA_URL", "http://env:2"}}), validation);
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->server.listen_port == 4000);
    REQUIRE(config->upstream.url == "http://env:2");
    REQUIRE_FALSE(validation.warnings.empty());
}

TEST_CASE("Startup fails on invalid configuration", "[cli][config]") {
    ValidationResult validation;

    CliOptions missing_file;
    missing_file.config_path = "/nonexistent/tollgate.json";
    REQUIRE_FALSE(resolve_config(missing_file, fake_env({}), validation).has_value());
    REQUIRE(validation.has_errors());

    CliOptions bad_url;
    bad_url.overrides.ollama_url = "not a url";
    REQUIRE_FALSE(resolve_config(bad_url, fake_env({}), validation).has_value());
    REQUIRE(validation.has_errors());
}

TEST_CASE("Key resolution", "[cli][keys]") {
    std::string error;

    tollgate::control::KeysConfig keys;
    keys.list = std::vector<std::string>{"a", "b"};
    auto resolved = resolve_keys(keys, error);
    REQUIRE(resolved.has_value());
    REQUIRE(resolved->size() == 2);

    keys.file = "/nonexistent/tollgate/keys";
    REQUIRE_FALSE(resolve_keys(keys, error).has_value());
    REQUIRE(error.find("/nonexistent/tollgate/keys") != std::string::npos);

    auto none = resolve_keys(tollgate::control::KeysConfig{}, error);
    REQUIRE(none.has_value());
    REQUIRE(none->empty());
}
