#include <catch2/catch_test_macros.hpp>
#include <conduit/core/mime.hpp>
#include <conduit/core/request.hpp>

using namespace conduit;

TEST_CASE("Request method parsing", "[request]") {
    REQUIRE(parse_method("GET") == HttpMethod::GET);
    REQUIRE(parse_method("DELETE") == HttpMethod::DELETE);
    REQUIRE(parse_method("BREW") == HttpMethod::UNKNOWN);
    REQUIRE(method_to_string(HttpMethod::PATCH) == "PATCH");
}

TEST_CASE("Request query parsing", "[request]") {
    SECTION("decodes pairs") {
        auto params = Request::parse_query("q=hello+world&page=2&tag=%23cpp");
        REQUIRE(params.at("q") == "hello world");
        REQUIRE(params.at("page") == "2");
        REQUIRE(params.at("tag") == "#cpp");
    }

    SECTION("flag without value and empty pairs") {
        auto params = Request::parse_query("debug&&x=1");
        REQUIRE(params.at("debug").empty());
        REQUIRE(params.at("x") == "1");
        REQUIRE(params.size() == 2);
    }

    SECTION("set_query_string replaces params") {
        Request req(HttpMethod::GET, "/posts");
        req.set_query_string("_format=json");
        REQUIRE(req.query_string() == "_format=json");
        REQUIRE(req.query_params().at("_format") == "json");
    }

    SECTION("malformed escape kept literally") {
        REQUIRE(url_decode("100%zz") == "100%zz");
    }
}

TEST_CASE("Request headers are case-insensitive", "[request]") {
    Request req(HttpMethod::GET, "/");
    req.add_header("Content-Type", "text/html");
    req.add_header("ACCEPT", "application/json");

    REQUIRE(req.header("content-type") == "text/html");
    REQUIRE(req.header("Accept") == "application/json");
    REQUIRE(req.content_type() == "text/html");
    REQUIRE_FALSE(req.header("cookie").has_value());
}

TEST_CASE("MimeTypes format table", "[request][mime]") {
    MimeTypes types;

    SECTION("built-ins") {
        REQUIRE(types.content_type("html") == "text/html");
        REQUIRE(types.content_type("json") == "application/json");
        REQUIRE(types.format_for("text/plain; charset=utf-8") == "text");
        REQUIRE(types.format_for("TEXT/XML") == "xml");
        REQUIRE(types.formats().front() == "html");
    }

    SECTION("custom formats") {
        types.register_format("csv", "text/csv");
        REQUIRE(types.knows("csv"));
        REQUIRE(types.format_for("text/csv") == "csv");
        REQUIRE(types.format_for_filename("report.CSV") == "csv");
        REQUIRE(types.format_for_filename("notes.txt") == "text");
        REQUIRE_FALSE(types.format_for_filename("archive.tar.zst").has_value());
    }

    SECTION("textual content types") {
        REQUIRE(is_textual_content_type("text/csv"));
        REQUIRE(is_textual_content_type("application/json"));
        REQUIRE_FALSE(is_textual_content_type("image/png"));
    }
}
