#include <catch2/catch_test_macros.hpp>
#include <conduit/core/error.hpp>
#include <conduit/core/finalizer.hpp>
#include <conduit/pipeline/pipeline.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace conduit;

namespace {

StageFn record(std::vector<std::string>& trace, std::string name) {
    return [&trace, name](Context&) -> Task<void> {
        trace.push_back(name);
        co_return;
    };
}

} // namespace

TEST_CASE("ActionGuard predicates", "[pipeline]") {
    REQUIRE(always().matches("anything"));

    auto guard = only({"index", "show"});
    REQUIRE(guard.matches("index"));
    REQUIRE_FALSE(guard.matches("delete"));
    REQUIRE(guard.actions() == std::vector<std::string>{"index", "show"});

    auto inverse = except({"index"});
    REQUIRE_FALSE(inverse.matches("index"));
    REQUIRE(inverse.matches("show"));

    auto custom = when([](std::string_view action) { return action.starts_with("admin_"); });
    REQUIRE(custom.matches("admin_users"));
    REQUIRE_FALSE(custom.matches("users"));
    REQUIRE(custom.actions().empty());
}

TEST_CASE("Pipeline runs matching stages in order", "[pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.add("a", record(trace, "a"))
            .add("b", record(trace, "b"), only({"index"}))
            .add("c", record(trace, "c"), except({"index"}))
            .add("d", record(trace, "d"), when([](std::string_view a) { return a.size() == 4; }))
            .add("e", record(trace, "e"));

    SECTION("index") {
        Context ctx(Request{});
        pipeline.run(ctx, "index").sync_wait();
        REQUIRE(trace == std::vector<std::string>{"a", "b", "e"});
    }

    SECTION("show") {
        Context ctx(Request{});
        pipeline.run(ctx, "show").sync_wait();
        REQUIRE(trace == std::vector<std::string>{"a", "c", "d", "e"});
    }

    SECTION("every ordering of guards is respected") {
        const std::vector<std::string> actions{"index", "show", "edit", "delete"};
        for (const auto& action : actions) {
            trace.clear();
            Context ctx(Request{});
            pipeline.run(ctx, action).sync_wait();

            std::vector<std::string> expected;
            for (const auto& stage : pipeline.stages()) {
                if (stage.guard.matches(action)) {
                    expected.push_back(stage.name);
                }
            }
            CHECK(trace == expected);
        }
    }
}

TEST_CASE("Empty pipeline leaves the context unchanged", "[pipeline]") {
    Pipeline pipeline;
    REQUIRE(pipeline.empty());

    Context ctx(Request{});
    pipeline.run(ctx, "index").sync_wait();
    REQUIRE_FALSE(ctx.committed());
    REQUIRE_FALSE(ctx.halted());
    REQUIRE_FALSE(ctx.has_status());
}

TEST_CASE("Pipeline stops on halt and commit", "[pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;

    SECTION("halt") {
        pipeline.add("first", record(trace, "first"))
                .add("halt", [](Context& ctx) -> Task<void> {
                    ctx.halt();
                    co_return;
                })
                .add("after", record(trace, "after"));

        Context ctx(Request{});
        pipeline.run(ctx, "index").sync_wait();
        REQUIRE(trace == std::vector<std::string>{"first"});
        REQUIRE(ctx.halted());
        REQUIRE_FALSE(ctx.committed());
    }

    SECTION("commit") {
        pipeline.add("send", [](Context& ctx) -> Task<void> {
                    commit(ctx, "early");
                    co_return;
                })
                .add("after", record(trace, "after"));

        Context ctx(Request{});
        pipeline.run(ctx, "index").sync_wait();
        REQUIRE(trace.empty());
        REQUIRE(ctx.resp_body() == "early");
    }
}

TEST_CASE("Pipeline aborts on a stage error", "[pipeline]") {
    std::vector<std::string> trace;
    Pipeline pipeline;
    pipeline.add("boom", [](Context&) -> Task<void> {
                throw std::runtime_error("boom");
                co_return;
            })
            .add("after", record(trace, "after"));

    Context ctx(Request{});
    REQUIRE_THROWS_AS(pipeline.run(ctx, "index").sync_wait(), std::runtime_error);
    REQUIRE(trace.empty());
}

TEST_CASE("Pipeline observes cancellation at stage boundaries", "[pipeline]") {
    std::vector<std::string> trace;
    CancellationSource source;

    Pipeline pipeline;
    pipeline.add("first", [&](Context&) -> Task<void> {
                trace.push_back("first");
                source.cancel();
                co_return;
            })
            .add("second", record(trace, "second"));

    Context ctx(Request{});
    ctx.set_cancellation(source.token());

    try {
        pipeline.run(ctx, "index").sync_wait();
        FAIL("cancelled run must throw");
    } catch (const ConduitError& e) {
        REQUIRE(e.code() == ErrorCode::Cancelled);
    }
    REQUIRE(trace == std::vector<std::string>{"first"});
    REQUIRE_FALSE(ctx.committed());
}

TEST_CASE("Pipeline rejects empty stages", "[pipeline]") {
    Pipeline pipeline;
    REQUIRE_THROWS_AS(pipeline.add("nothing", StageFn{}), std::invalid_argument);
    pipeline.add("named", [](Context&) -> Task<void> { co_return; });
    REQUIRE(pipeline.contains("named"));
    REQUIRE_FALSE(pipeline.contains("other"));
    REQUIRE(pipeline.size() == 1);
}
