// Tollgate Key Source Unit Tests

#include <sqlite3.h>

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/key_source.hpp"

using namespace tollgate::control;

namespace {

/// Temporary file removed on scope exit
struct TempPath {
    std::filesystem::path path;

    explicit TempPath(const std::string& name)
        : path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove(path);
    }
    ~TempPath() { std::filesystem::remove(path); }

    void write(const std::string& content) const {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
};

/// Create a key database with the given statements
void create_db(const std::filesystem::path& path, const char* sql) {
    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &raw) == SQLITE_OK);
    SqlitePtr db{raw};
    char* err = nullptr;
    int rc = sqlite3_exec(db.get(), sql, nullptr, nullptr, &err);
    sqlite3_free(err);
    REQUIRE(rc == SQLITE_OK);
}

}  // namespace

TEST_CASE("List key source trims and drops empty keys", "[keys]") {
    ListKeySource source({" a ", "", "b", "   "});
    std::error_code ec;
    auto keys = source.resolve_keys(ec);
    REQUIRE_FALSE(ec);
    REQUIRE(keys.has_value());
    REQUIRE(*keys == std::vector<std::string>{"a", "b"});
}

TEST_CASE("File key source", "[keys][file]") {
    TempPath file("tollgate_test_keys.txt");
    std::error_code ec;

    SECTION("Comma and newline separated") {
        file.write("foo,bar\n baz \r\n\n");
        auto keys = FileKeySource(file.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(ec);
        REQUIRE(keys.has_value());
        REQUIRE(*keys == std::vector<std::string>{"foo", "bar", "baz"});
    }

    SECTION("Empty file yields no keys") {
        file.write("");
        auto keys = FileKeySource(file.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(ec);
        REQUIRE(keys.has_value());
        REQUIRE(keys->empty());
    }

    SECTION("Key with control bytes is a parse error") {
        file.write(std::string("good,ba\x01") + "d\n");
        auto keys = FileKeySource(file.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::ParseError));
    }

    SECTION("Missing file is an I/O error") {
        auto keys = FileKeySource("/nonexistent/tollgate/keys").resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::IoError));
        REQUIRE(std::string(ec.category().name()) == "key_source");
    }
}

TEST_CASE("SQLite key source", "[keys][sqlite]") {
    TempPath db("tollgate_test_keys.db");
    std::error_code ec;

    SECTION("Reads every row") {
        create_db(db.path,
                  "CREATE TABLE api_keys (key TEXT);"
                  "INSERT INTO api_keys VALUES ('x');"
                  "INSERT INTO api_keys VALUES ('y');");
        auto keys = SqliteKeySource(db.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(ec);
        REQUIRE(keys.has_value());
        REQUIRE(keys->size() == 2);
        REQUIRE(((*keys)[0] == "x" || (*keys)[1] == "x"));
    }

    SECTION("NULL key is a query error") {
        create_db(db.path,
                  "CREATE TABLE api_keys (key TEXT);"
                  "INSERT INTO api_keys VALUES ('x');"
                  "INSERT INTO api_keys VALUES (NULL);");
        auto keys = SqliteKeySource(db.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::QueryError));
    }

    SECTION("Key with control bytes is a parse error") {
        create_db(db.path,
                  "CREATE TABLE api_keys (key TEXT);"
                  "INSERT INTO api_keys VALUES ('good');"
                  "INSERT INTO api_keys VALUES ('ba' || char(1) || 'd');");
        auto keys = SqliteKeySource(db.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::ParseError));
    }

    SECTION("Missing table is a query error") {
        create_db(db.path, "CREATE TABLE other (id INTEGER);");
        auto keys = SqliteKeySource(db.path.string()).resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::QueryError));
    }

    SECTION("Missing database is an I/O error") {
        auto keys = SqliteKeySource("/nonexistent/tollgate/keys.db").resolve_keys(ec);
        REQUIRE_FALSE(keys.has_value());
        REQUIRE(ec == make_key_source_error(KeySourceErrc::IoError));
    }
}

TEST_CASE("Key source precedence", "[keys]") {
    KeysConfig config;
    REQUIRE(dynamic_cast<ListKeySource*>(make_key_source(config).get()) != nullptr);

    config.list = std::vector<std::string>{"a"};
    REQUIRE(dynamic_cast<ListKeySource*>(make_key_source(config).get()) != nullptr);

    config.file = "/etc/tollgate/keys";
    REQUIRE(dynamic_cast<FileKeySource*>(make_key_source(config).get()) != nullptr);

    config.sqlite = "/var/lib/tollgate/keys.db";
    auto source = make_key_source(config);
    REQUIRE(dynamic_cast<SqliteKeySource*>(source.get()) != nullptr);
    REQUIRE(source->describe().find("keys.db") != std::string::npos);
}
