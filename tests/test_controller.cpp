#include <catch2/catch_test_macros.hpp>
#include <conduit/controller/controller.hpp>
#include <conduit/controller/redirect.hpp>
#include <conduit/core/finalizer.hpp>
#include <conduit/pipeline/stages.hpp>
#include <conduit/view/render.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include "support.hpp"

using namespace conduit;
using conduit::testing::MapTemplateEngine;

namespace {

std::shared_ptr<MapTemplateEngine> page_templates() {
    auto engine = std::make_shared<MapTemplateEngine>();
    engine->add("page/index.html", "<h1>{{ message }}</h1>")
           .add("page/index.text", "{{ message }}")
           .add("page/show.html", "<p>{{ id }}</p>")
           .add("layouts/app.html", "<body>{{ inner_content }}</body>");
    return engine;
}

// accepts(html, text) -> dispatch -> auto_render only for index
void define_page(Controller& page, std::shared_ptr<MapTemplateEngine> engine) {
    page.set_templates(std::move(engine))
        .action("index", [](Context& ctx) -> Task<void> {
            ctx.assign("message", "Hello");
            co_return;
        })
        .action("show", [](Context& ctx) -> Task<void> {
            ctx.assign("id", std::string(ctx.param("id").value_or("?")));
            render(ctx, "show.html");
            co_return;
        })
        .action("redirect_test", [](Context& ctx) -> Task<void> {
            redirect(ctx, To::internal("/redirect_test"));
            render(ctx, "show.html");
            co_return;
        })
        .plug("accepts", stages::accepts({"html", "text"}))
        .plug_dispatch()
        .plug_auto_render(only({"index"}))
        .freeze();
}

ControllerOptions page_options() {
    ControllerOptions options;
    options.accepted_formats = {"html", "text"};
    options.layout = "layouts/app";
    return options;
}

} // namespace

TEST_CASE("Auto-render for listed actions", "[controller]") {
    auto engine = page_templates();
    Controller page("page", page_options());
    define_page(page, engine);

    Context ctx(Request(HttpMethod::GET, "/"));
    page.call(ctx, "index").sync_wait();

    REQUIRE(ctx.committed());
    REQUIRE(ctx.status() == 200);
    REQUIRE(ctx.resp_body() == "<body><h1>Hello</h1></body>");
    REQUIRE(ctx.resp_header("content-type") == "text/html; charset=utf-8");
    REQUIRE(ctx.controller() == "page");
    REQUIRE(ctx.action() == "index");
    REQUIRE(ctx.format() == "html");
    REQUIRE(engine->lookups() == std::vector<std::string>{"page/index.html", "layouts/app.html"});
}

TEST_CASE("Auto-render honours the negotiated format", "[controller]") {
    auto engine = page_templates();
    Controller page("page", page_options());
    define_page(page, engine);

    Request req(HttpMethod::GET, "/");
    req.add_header("accept", "text/plain");
    Context ctx(std::move(req));
    page.call(ctx, "index").sync_wait();

    REQUIRE(ctx.resp_body() == "Hello");
    REQUIRE(ctx.resp_header("content-type") == "text/plain; charset=utf-8");
}

TEST_CASE("Manual render when auto-render is skipped", "[controller]") {
    auto engine = page_templates();
    Controller page("page", page_options());
    define_page(page, engine);

    Request req(HttpMethod::GET, "/pages/9");
    req.add_path_param("id", "9");
    Context ctx(std::move(req));

    REQUIRE_NOTHROW(page.call(ctx, "show").sync_wait());
    REQUIRE(ctx.resp_body() == "<body><p>9</p></body>");
    REQUIRE(ctx.status() == 200);
}

TEST_CASE("Render after redirect is a double commit", "[controller]") {
    auto engine = page_templates();
    Controller page("page", page_options());
    define_page(page, engine);

    Context ctx(Request(HttpMethod::GET, "/"));
    try {
        page.call(ctx, "redirect_test").sync_wait();
        FAIL("render after redirect must throw");
    } catch (const ConduitError& e) {
        REQUIRE(e.code() == ErrorCode::DoubleCommit);
    }

    REQUIRE(ctx.committed());
    REQUIRE(ctx.status() == 302);
    REQUIRE(ctx.resp_header("location") == "/redirect_test");
    REQUIRE(ctx.resp_body().empty());
}

TEST_CASE("Unsupported format becomes a 406", "[controller]") {
    auto engine = page_templates();
    Request req(HttpMethod::GET, "/");
    req.add_query_param("_format", "xml");

    SECTION("default error response") {
        Controller page("page", page_options());
        define_page(page, engine);

        Context ctx(std::move(req));
        page.call(ctx, "index").sync_wait();

        REQUIRE(engine->lookups().empty());
        REQUIRE(ctx.committed());
        REQUIRE(ctx.status() == 406);
        REQUIRE(ctx.resp_header("content-type") == "text/plain; charset=utf-8");
        REQUIRE(std::string(ctx.resp_body()).find("Unsupported format") != std::string::npos);
    }

    SECTION("action fallback") {
        Controller page("page", page_options());
        std::optional<ErrorCode> seen;
        page.fallback([&seen](Context& ctx, const Error& error) -> Task<void> {
            seen = error.code();
            ctx.put_status(error.http_status());
            json(ctx, nlohmann::json{{"error", "not acceptable"}});
            co_return;
        });
        define_page(page, engine);

        Context ctx(std::move(req));
        page.call(ctx, "index").sync_wait();

        REQUIRE(seen == ErrorCode::UnsupportedFormat);
        REQUIRE(ctx.status() == 406);
        REQUIRE(ctx.resp_body() == "{\"error\":\"not acceptable\"}");
    }
}

TEST_CASE("Missing template becomes a 404", "[controller]") {
    auto engine = std::make_shared<MapTemplateEngine>();
    Controller page("page");
    page.set_templates(engine)
        .action("index", [](Context&) -> Task<void> { co_return; })
        .plug_dispatch()
        .plug_auto_render()
        .freeze();

    Context ctx(Request{});
    page.call(ctx, "index").sync_wait();
    REQUIRE(ctx.status() == 404);
}

TEST_CASE("Controller dispatch errors", "[controller]") {
    Controller page("page");
    page.action("index", [](Context& ctx) -> Task<void> {
            text(ctx, "ok");
            co_return;
        })
        .plug_dispatch();

    SECTION("call before freeze") {
        Context ctx(Request{});
        REQUIRE_THROWS_AS(page.call(ctx, "index").sync_wait(), std::logic_error);
    }

    SECTION("unknown action") {
        page.freeze();
        Context ctx(Request{});
        try {
            page.call(ctx, "destroy").sync_wait();
            FAIL("unknown action must throw");
        } catch (const ConduitError& e) {
            REQUIRE(e.code() == ErrorCode::UnknownAction);
            REQUIRE(e.error().is_fatal());
        }
    }

    SECTION("fatal errors propagate") {
        Controller broken("broken");
        broken.action("index", [](Context& ctx) -> Task<void> {
                  (void)ctx.session();
                  co_return;
              })
              .plug_dispatch()
              .freeze();

        Context ctx(Request{});
        try {
            broken.call(ctx, "index").sync_wait();
            FAIL("session access without fetch_session must throw");
        } catch (const ConduitError& e) {
            REQUIRE(e.code() == ErrorCode::SessionNotFetched);
        }
    }
}

TEST_CASE("Controller registration is validated on freeze", "[controller]") {
    auto noop = [](Context&) -> Task<void> { co_return; };

    SECTION("missing dispatch stage") {
        Controller c("c");
        c.action("index", noop);
        REQUIRE_THROWS_AS(c.freeze(), std::logic_error);
    }

    SECTION("guard naming an unknown action") {
        Controller c("c");
        c.action("index", noop).plug_dispatch().plug_auto_render(only({"indx"}));
        REQUIRE_THROWS_AS(c.freeze(), std::logic_error);
    }

    SECTION("duplicate action") {
        Controller c("c");
        c.action("index", noop);
        REQUIRE_THROWS_AS(c.action("index", noop), std::logic_error);
    }

    SECTION("registration after freeze") {
        Controller c("c");
        c.action("index", noop).plug_dispatch().freeze();
        REQUIRE(c.frozen());
        REQUIRE_THROWS_AS(c.action("show", noop), std::logic_error);
        REQUIRE_THROWS_AS(c.plug("late", noop), std::logic_error);
        REQUIRE(c.actions() == std::vector<std::string>{"index"});
        REQUIRE(c.options().view == "c");
    }
}

TEST_CASE("Stages guarded per action", "[controller]") {
    std::vector<std::string> trace;
    Controller admin("admin");
    admin.action("index", [&](Context& ctx) -> Task<void> {
            trace.push_back("index");
            text(ctx, "index");
            co_return;
        })
        .action("login", [&](Context& ctx) -> Task<void> {
            trace.push_back("login");
            text(ctx, "login");
            co_return;
        })
        .plug("authenticate",
              [&](Context& ctx) -> Task<void> {
                  trace.push_back("authenticate");
                  if (!ctx.request().header("authorization")) {
                      redirect(ctx, To::internal("/login"));
                  }
                  co_return;
              },
              except({"login"}))
        .plug_dispatch()
        .freeze();

    SECTION("protected action redirects") {
        Context ctx(Request{});
        admin.call(ctx, "index").sync_wait();
        REQUIRE(trace == std::vector<std::string>{"authenticate"});
        REQUIRE(ctx.status() == 302);
    }

    SECTION("excluded action skips the stage") {
        Context ctx(Request{});
        admin.call(ctx, "login").sync_wait();
        REQUIRE(trace == std::vector<std::string>{"login"});
        REQUIRE(ctx.resp_body() == "login");
    }
}
