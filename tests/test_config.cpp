#include <catch2/catch_test_macros.hpp>
#include <conduit/core/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace conduit;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE("EndpointConfig defaults", "[config]") {
    EndpointConfig config;
    REQUIRE(config.template_dir == "templates");
    REQUIRE(config.template_caching);
    REQUIRE_FALSE(config.default_layout.has_value());
    REQUIRE(config.accepted_formats.empty());
    REQUIRE(config.session_cookie == "_conduit_key");
    REQUIRE(config.log_level == LogLevel::Info);
}

TEST_CASE("EndpointConfig from_json", "[config]") {
    auto config = EndpointConfig::from_json(nlohmann::json::parse(R"({
        "template_dir": "views",
        "template_caching": false,
        "default_layout": "layouts/app",
        "accepted_formats": ["html", "json", 3],
        "session_cookie": "_shop_key",
        "log_level": "debug",
        "unknown": true
    })"));

    REQUIRE(config.template_dir == "views");
    REQUIRE_FALSE(config.template_caching);
    REQUIRE(config.default_layout == "layouts/app");
    REQUIRE(config.accepted_formats == std::vector<std::string>{"html", "json"});
    REQUIRE(config.session_cookie == "_shop_key");
    REQUIRE(config.log_level == LogLevel::Debug);

    SECTION("wrong types keep defaults") {
        auto other = EndpointConfig::from_json(nlohmann::json::parse(R"({"template_caching": "no"})"));
        REQUIRE(other.template_caching);
        REQUIRE(EndpointConfig::from_json(nlohmann::json::array()).session_cookie == "_conduit_key");
    }
}

TEST_CASE("EndpointConfig from_file", "[config]") {
    SECTION("valid file") {
        auto path = write_temp("conduit-config-valid.json", R"({"template_dir": "web/templates"})");
        REQUIRE(EndpointConfig::from_file(path).template_dir == "web/templates");
        std::filesystem::remove(path);
    }

    SECTION("malformed file names the file") {
        auto path = write_temp("conduit-config-broken.json", "{ not json");
        try {
            (void)EndpointConfig::from_file(path);
            FAIL("malformed config must throw");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("conduit-config-broken.json") != std::string::npos);
        }
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(EndpointConfig::from_file("/nonexistent/conduit.json"), std::runtime_error);
    }
}

TEST_CASE("EndpointConfig from_env", "[config]") {
    ::setenv("CONDUIT_TEMPLATE_DIR", "/srv/templates", 1);
    ::setenv("CONDUIT_LOG_LEVEL", "error", 1);
    ::unsetenv("CONDUIT_SESSION_COOKIE");

    EndpointConfig base;
    base.session_cookie = "_base_key";
    auto config = EndpointConfig::from_env(base);

    ::unsetenv("CONDUIT_TEMPLATE_DIR");
    ::unsetenv("CONDUIT_LOG_LEVEL");

    REQUIRE(config.template_dir == "/srv/templates");
    REQUIRE(config.log_level == LogLevel::Error);
    REQUIRE(config.session_cookie == "_base_key");
}
