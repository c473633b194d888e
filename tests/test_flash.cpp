#include <catch2/catch_test_macros.hpp>
#include <conduit/core/flash.hpp>

#include <string>
#include <vector>

using namespace conduit;
using Messages = FlashStore::Messages;

namespace {

// One request boundary: what the next request hydrates from the session
FlashStore next_request(const FlashStore& store) {
    return FlashStore::hydrate(store.serialize());
}

} // namespace

TEST_CASE("Flash put and peek", "[flash]") {
    FlashStore flash;
    flash.put("info", "Welcome back");
    flash.put("info", "You have mail");
    flash.put("error", "Payment failed");

    REQUIRE(flash.get("info") == "Welcome back");
    REQUIRE(flash.get_all("info") == Messages{"Welcome back", "You have mail"});

    SECTION("peeks do not mutate") {
        (void)flash.get("info");
        (void)flash.get_all("info");
        REQUIRE(flash.get_all("info").size() == 2);
        REQUIRE(flash.size() == 2);
    }

    SECTION("to_json for templates") {
        auto json = flash.to_json();
        REQUIRE(json["error"][0] == "Payment failed");
        REQUIRE(json["info"].size() == 2);
    }
}

TEST_CASE("Flash absent keys behave as empty", "[flash]") {
    FlashStore flash;
    REQUIRE_FALSE(flash.get("never").has_value());
    REQUIRE(flash.get_all("never").empty());
    REQUIRE(flash.pop_all("never").empty());
    REQUIRE_NOTHROW(flash.persist("never"));
    REQUIRE_FALSE(flash.is_persisted("never"));
    REQUIRE(flash.empty());
}

TEST_CASE("Flash pop_all consumes exactly once", "[flash]") {
    FlashStore flash;
    flash.put("info", "a");
    flash.put("info", "b");

    REQUIRE(flash.pop_all("info") == Messages{"a", "b"});
    REQUIRE(flash.get_all("info").empty());
    REQUIRE(flash.pop_all("info").empty());
}

TEST_CASE("Flash clear removes everything", "[flash]") {
    FlashStore flash;
    flash.put("info", "a");
    flash.put("error", "b");
    flash.persist("info");

    flash.clear();
    REQUIRE(flash.empty());
    REQUIRE(flash.keys().empty());
    REQUIRE_FALSE(flash.is_persisted("info"));
    REQUIRE(flash.serialize().empty());
}

TEST_CASE("Flash persistence lasts one request", "[flash]") {
    FlashStore first;
    first.put("info", "Saved");
    first.put("notice", "Not persisted");
    first.persist("info");

    SECTION("non-persisted keys are dropped at the boundary") {
        auto second = next_request(first);
        REQUIRE(second.get_all("info") == Messages{"Saved"});
        REQUIRE(second.get_all("notice").empty());
    }

    SECTION("persisted messages vanish after one cycle even if unread") {
        auto second = next_request(first);
        auto third = next_request(second);
        REQUIRE(third.get_all("info").empty());
        REQUIRE(third.empty());
    }

    SECTION("persisting again carries them one more request") {
        auto second = next_request(first);
        second.persist("info");
        auto third = next_request(second);
        REQUIRE(third.get("info") == "Saved");
    }

    SECTION("persist snapshots current messages") {
        first.put("info", "Added after persist");
        auto second = next_request(first);
        REQUIRE(second.get_all("info") == Messages{"Saved"});
    }

    SECTION("pop_all withdraws the persisted snapshot") {
        REQUIRE(first.pop_all("info") == Messages{"Saved"});
        REQUIRE(next_request(first).empty());
    }
}

TEST_CASE("Flash hydrate tolerates foreign data", "[flash]") {
    auto flash = FlashStore::hydrate(nlohmann::json::parse(
        R"({"info": "single", "error": ["a", 1, "b"], "bad": {"x": 1}})"));
    REQUIRE(flash.get_all("info") == Messages{"single"});
    REQUIRE(flash.get_all("error") == Messages{"a", "b"});
    REQUIRE(flash.get_all("bad").empty());

    REQUIRE(FlashStore::hydrate(nlohmann::json(42)).empty());
}
