#include <catch2/catch_test_macros.hpp>
#include <conduit/core/error.hpp>

#include <string>

using namespace conduit;

TEST_CASE("Error classification", "[error]") {
    SECTION("fatal codes") {
        for (auto code : {ErrorCode::DoubleCommit, ErrorCode::InvalidStatus,
                          ErrorCode::MisusedRedirect, ErrorCode::UnknownAction,
                          ErrorCode::SessionNotFetched, ErrorCode::FlashNotFetched,
                          ErrorCode::NoResponse}) {
            Error e(code);
            CHECK(e.is_fatal());
            CHECK(!e.is_reportable());
            CHECK(e.http_status() == 500);
        }
    }

    SECTION("reportable codes") {
        for (auto code : {ErrorCode::TemplateNotFound, ErrorCode::TemplateRenderFailed,
                          ErrorCode::UnsupportedFormat}) {
            Error e(code);
            CHECK(e.is_reportable());
            CHECK(!e.is_fatal());
        }
    }

    SECTION("cancellation is neither") {
        Error e = Error::cancelled();
        REQUIRE(e.is_cancelled());
        REQUIRE(!e.is_fatal());
        REQUIRE(!e.is_reportable());
        REQUIRE(e.http_status() == 499);
    }
}

TEST_CASE("Error http_status mapping", "[error]") {
    REQUIRE(Error::template_not_found("page/index.html").http_status() == 404);
    REQUIRE(Error::unsupported_format("xml", "html, text").http_status() == 406);
    REQUIRE(Error(ErrorCode::TemplateRenderFailed).http_status() == 500);
    REQUIRE(Error::double_commit("render").http_status() == 500);
}

TEST_CASE("Error factory messages", "[error]") {
    SECTION("template_not_found names the key") {
        auto e = Error::template_not_found("page/show.json");
        REQUIRE(e.code() == ErrorCode::TemplateNotFound);
        REQUIRE(e.message().find("page/show.json") != std::string_view::npos);
    }

    SECTION("unsupported_format names format and accepted set") {
        auto e = Error::unsupported_format("xml", "html, text");
        REQUIRE(e.message().find("xml") != std::string_view::npos);
        REQUIRE(e.message().find("html, text") != std::string_view::npos);
    }

    SECTION("misused_redirect names the target") {
        auto e = Error::misused_redirect("https://example.com", "not a path");
        REQUIRE(e.code() == ErrorCode::MisusedRedirect);
        REQUIRE(e.message().find("https://example.com") != std::string_view::npos);
    }
}

TEST_CASE("Error to_string", "[error]") {
    Error e(ErrorCode::TemplateNotFound, "could not find template \"a/b.html\"");
    std::string s = e.to_string();
    REQUIRE(s.find("conduit::") == 0);
    REQUIRE(s.find("Template not found") != std::string::npos);
    REQUIRE(s.find("a/b.html") != std::string::npos);
}

TEST_CASE("Error code category", "[error]") {
    std::error_code ec = ErrorCode::DoubleCommit;
    REQUIRE(ec.category() == error_category());
    REQUIRE(std::string(ec.category().name()) == "conduit");
    REQUIRE(ec.message() == "Response already sent");
    REQUIRE(Error(ErrorCode::DoubleCommit).error_code() == ec);
}

TEST_CASE("ConduitError carries the error", "[error]") {
    try {
        throw ConduitError(Error::invalid_status("999"));
    } catch (const ConduitError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidStatus);
        REQUIRE(std::string(e.what()).find("999") != std::string::npos);
        REQUIRE(e.error() == Error(ErrorCode::InvalidStatus));
    }
}
