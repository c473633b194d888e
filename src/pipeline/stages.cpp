#include "conduit/pipeline/stages.hpp"

#include "conduit/core/context.hpp"
#include "conduit/core/cookie.hpp"
#include "conduit/core/status.hpp"
#include "conduit/view/render.hpp"

#include <chrono>

namespace conduit::stages {

StageFn accepts(std::vector<std::string> formats) {
    return [formats = std::move(formats)](Context& ctx) -> Task<void> {
        ctx.set_accepted_formats(formats);
        ctx.set_format(negotiate_format(ctx, accepted_formats(ctx)));
        co_return;
    };
}

StageFn put_layout(std::optional<std::string> layout) {
    return [layout = std::move(layout)](Context& ctx) -> Task<void> {
        ctx.put_layout(layout);
        co_return;
    };
}

// ============================================================================
// Session
// ============================================================================

StageFn fetch_session(std::shared_ptr<SessionStore> store, SessionOptions options) {
    return [store = std::move(store), options = std::move(options)](Context& ctx) -> Task<void> {
        std::shared_ptr<Session> session;

        auto jar = CookieJar::parse(ctx.request().header("cookie").value_or(""));
        if (auto id = jar.get(options.cookie_name)) {
            if (auto data = store->load(std::string(*id))) {
                session = std::make_shared<Session>(Session::deserialize(std::string(*id), *data));
            }
        }
        if (!session) {
            session = std::make_shared<Session>(store->generate_id(), true);
        }

        ctx.set_session(session);

        ctx.register_before_send([store, options, session](Context& c) {
            if (session->is_dropped()) {
                store->destroy(session->id());
                if (!session->is_new()) {
                    c.add_resp_header("set-cookie",
                                      Cookie::expired(options.cookie_name, options.cookie_path).to_header());
                }
                return;
            }

            bool fresh = session->is_new() && !session->empty();
            if (session->is_modified() || fresh) {
                store->save(session->id(), session->serialize());
                session->mark_saved();
            }
            if (fresh) {
                c.add_resp_header("set-cookie", options.make_cookie(session->id()).to_header());
            }
        });
        co_return;
    };
}

// ============================================================================
// Flash
// ============================================================================

StageFn fetch_flash(FlashOptions options) {
    return [options](Context& ctx) -> Task<void> {
        const std::string key(FlashStore::session_key);

        auto& session = ctx.session();
        if (const auto* stored = session.find(key)) {
            ctx.set_flash(FlashStore::hydrate(*stored));
        } else {
            ctx.set_flash(FlashStore{});
        }

        ctx.register_before_send([options, key](Context& c) {
            auto& flash = c.flash();
            auto status = c.status();
            if (options.persist_on_redirect && status && is_redirect_status(*status)) {
                flash.persist_all();
            }

            auto& s = c.session();
            auto snapshot = flash.serialize();
            if (!snapshot.empty()) {
                s.set(key, std::move(snapshot));
            } else if (s.has(key)) {
                s.remove(key);
            }
        });
        co_return;
    };
}

// ============================================================================
// Request logging
// ============================================================================

StageFn log_request(Logger& logger) {
    return [&logger](Context& ctx) -> Task<void> {
        auto start = std::chrono::steady_clock::now();

        ctx.register_before_send([&logger, start](Context& c) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            int status = c.status().value_or(200);
            auto method = method_to_string(c.request().method());

            std::string message(method);
            message += ' ';
            message += c.request().path();
            message += " - Sent " + std::to_string(status) + " in " + std::to_string(elapsed) + "ms";

            logger.log(logger.entry(LogLevel::Info, std::move(message))
                           .field("method", method)
                           .field("path", c.request().path())
                           .field("status", status)
                           .field("duration_ms", elapsed));
        });
        co_return;
    };
}

StageFn log_request() {
    return log_request(default_logger());
}

} // namespace conduit::stages
