// Sluice Backend Address Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/url.hpp"

using namespace sluice::core;

TEST_CASE("Parse backend address", "[url]") {
    SECTION("host and port") {
        auto addr = parse_backend_address("http://localhost:9001");
        REQUIRE(addr.has_value());
        REQUIRE(addr->host == "localhost");
        REQUIRE(addr->port == 9001);
        REQUIRE(addr->base_path.empty());
        REQUIRE(addr->origin() == "http://localhost:9001");
        REQUIRE(addr->path("/stream") == "/stream");
    }

    SECTION("default port") {
        auto addr = parse_backend_address("http://backend.internal");
        REQUIRE(addr.has_value());
        REQUIRE(addr->port == 80);
    }

    SECTION("base path and trailing slashes") {
        auto addr = parse_backend_address("http://10.0.0.5:8080/api/v1//");
        REQUIRE(addr.has_value());
        REQUIRE(addr->base_path == "/api/v1");
        REQUIRE(addr->path("/math/add") == "/api/v1/math/add");
        REQUIRE(addr->to_string() == "http://10.0.0.5:8080/api/v1");
    }

    SECTION("root path only") {
        auto addr = parse_backend_address("http://h:1/");
        REQUIRE(addr.has_value());
        REQUIRE(addr->base_path.empty());
        REQUIRE(addr->path("") == "/");
    }

    SECTION("equal addresses compare equal") {
        REQUIRE(parse_backend_address("http://h:81/x/") == parse_backend_address("http://h:81/x"));
    }
}

TEST_CASE("Reject malformed backend addresses", "[url]") {
    REQUIRE_FALSE(parse_backend_address("").has_value());
    REQUIRE_FALSE(parse_backend_address("http://").has_value());
    REQUIRE_FALSE(parse_backend_address("https://secure:443").has_value());
    REQUIRE_FALSE(parse_backend_address("ftp://host").has_value());
    REQUIRE_FALSE(parse_backend_address("localhost:9001").has_value());
    REQUIRE_FALSE(parse_backend_address("http://:9001").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host:").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host:0").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host:70000").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host:80x").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host/path?q=1").has_value());
    REQUIRE_FALSE(parse_backend_address("http://host/#frag").has_value());
    REQUIRE_FALSE(parse_backend_address("http://user@host").has_value());
}
