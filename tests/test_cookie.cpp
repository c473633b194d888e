#include <catch2/catch_test_macros.hpp>
#include <conduit/core/cookie.hpp>

#include <string>
#include <vector>

using namespace conduit;

TEST_CASE("Cookie serialization", "[cookie]") {
    SECTION("all attributes") {
        Cookie c;
        c.name = "_app_key";
        c.value = "abc123";
        c.path = "/";
        c.domain = "example.com";
        c.max_age = std::chrono::seconds(3600);
        c.secure = true;
        c.http_only = true;
        c.same_site = SameSite::Strict;

        auto header = c.to_header();
        REQUIRE(header.find("_app_key=abc123") == 0);
        REQUIRE(header.find("; Domain=example.com") != std::string::npos);
        REQUIRE(header.find("; Path=/") != std::string::npos);
        REQUIRE(header.find("; Max-Age=3600") != std::string::npos);
        REQUIRE(header.find("; Secure") != std::string::npos);
        REQUIRE(header.find("; HttpOnly") != std::string::npos);
        REQUIRE(header.find("; SameSite=Strict") != std::string::npos);
        REQUIRE(header.find("Expires") == std::string::npos);
    }

    SECTION("expired cookie") {
        auto header = Cookie::expired("_app_key").to_header();
        REQUIRE(header.find("_app_key=") == 0);
        REQUIRE(header.find("Max-Age=0") != std::string::npos);
        REQUIRE(header.find("Expires=Thu, 01 Jan 1970") != std::string::npos);
    }
}

TEST_CASE("CookieJar parsing", "[cookie]") {
    auto jar = CookieJar::parse("a=1; b=\"two\" ;c=; =skipped; a=ignored");

    REQUIRE(jar.size() == 3);
    REQUIRE(jar.get("a") == "1");
    REQUIRE(jar.get("b") == "two");
    REQUIRE(jar.get("c") == "");
    REQUIRE(jar.has("c"));
    REQUIRE_FALSE(jar.has("d"));
    REQUIRE(CookieJar::parse("").empty());
}

TEST_CASE("Expired cookies keep their path", "[cookie]") {
    auto header = Cookie::expired("_app_key", "/admin").to_header();
    REQUIRE(header.find("; Path=/admin") != std::string::npos);
    REQUIRE(header.find("; SameSite=Lax") != std::string::npos);

    auto jar = CookieJar::parse("z=1; a=2");
    REQUIRE(jar.names() == std::vector<std::string>{"a", "z"});
    REQUIRE(same_site_name(SameSite::None) == "None");
}
