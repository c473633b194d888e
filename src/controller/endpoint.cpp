#include "conduit/controller/endpoint.hpp"

#include "conduit/core/error.hpp"
#include "conduit/core/finalizer.hpp"
#include "conduit/core/logging.hpp"
#include "conduit/core/status.hpp"
#include "conduit/view/inja_engine.hpp"

#include <stdexcept>

namespace conduit {

namespace {

// Commits the error body into an uncommitted context so before-send work
// (flash aging, session save, request log) still runs. Only set-cookie
// headers from the context reach the client.
Response error_response(Context& ctx, int status) {
    auto plain = Response::plain(status, std::string(reason_phrase(status)));
    if (ctx.committed()) {
        return plain;
    }

    try {
        ctx.put_status(status);
        commit(ctx, std::string(plain.body()));
    } catch (const std::exception& e) {
        log_error(std::string("Before-send failed on the error path: ") + e.what());
        return plain;
    }

    auto headers = plain.headers();
    for (const auto& [name, value] : ctx.resp_headers()) {
        if (name == "set-cookie") {
            headers.emplace_back(name, value);
        }
    }
    return Response(status, std::move(headers), std::string(plain.body()));
}

} // anonymous namespace

Endpoint::Endpoint(EndpointConfig config)
    : config_(std::move(config))
    , templates_(std::make_shared<InjaTemplateEngine>(config_.template_dir, config_.template_caching))
    , sessions_(std::make_shared<MemorySessionStore>())
    , mime_types_(std::make_shared<MimeTypes>(*MimeTypes::builtin()))
{
    session_options_.cookie_name = config_.session_cookie;
    default_logger().set_level(config_.log_level);
}

Controller& Endpoint::add_controller(const std::string& name, ControllerOptions options) {
    if (frozen_) {
        throw std::logic_error("cannot add controller \"" + name + "\" after freeze()");
    }
    if (controllers_.count(name) > 0) {
        throw std::logic_error("controller \"" + name + "\" defined twice");
    }
    if (options.accepted_formats.empty()) {
        options.accepted_formats = config_.accepted_formats;
    }
    auto& slot = controllers_[name];
    slot = std::make_unique<Controller>(name, std::move(options));
    return *slot;
}

Controller& Endpoint::controller(const std::string& name) {
    ControllerOptions options;
    options.layout = config_.default_layout;
    return add_controller(name, std::move(options));
}

Controller& Endpoint::controller(const std::string& name, ControllerOptions options) {
    return add_controller(name, std::move(options));
}

Controller* Endpoint::find_controller(const std::string& name) const {
    auto it = controllers_.find(name);
    return it == controllers_.end() ? nullptr : it->second.get();
}

Endpoint& Endpoint::set_templates(std::shared_ptr<const TemplateEngine> engine) {
    if (frozen_) {
        throw std::logic_error("cannot replace the template engine after freeze()");
    }
    if (!engine) {
        throw std::invalid_argument("template engine must not be null");
    }
    templates_ = std::move(engine);
    return *this;
}

Endpoint& Endpoint::set_session_store(std::shared_ptr<SessionStore> store) {
    if (frozen_) {
        throw std::logic_error("cannot replace the session store after freeze()");
    }
    if (!store) {
        throw std::invalid_argument("session store must not be null");
    }
    sessions_ = std::move(store);
    return *this;
}

MimeTypes& Endpoint::mime_types() {
    if (frozen_) {
        throw std::logic_error("cannot register formats after freeze()");
    }
    return *mime_types_;
}

void Endpoint::freeze() {
    for (auto& [name, controller] : controllers_) {
        controller->freeze();
    }
    frozen_ = true;
}

// ============================================================================
// Serving
// ============================================================================

Task<Response> Endpoint::serve(Request request, std::string controller, std::string action,
                               CancellationToken cancellation) const {
    Context ctx(std::move(request));
    ctx.set_cancellation(std::move(cancellation));
    co_return co_await serve(ctx, std::move(controller), std::move(action));
}

Task<Response> Endpoint::serve(Context& ctx, std::string controller, std::string action) const {
    std::optional<Error> failure;
    std::optional<std::string> crash;

    ctx.set_templates(templates_);
    ctx.set_mime_types(mime_types_);

    try {
        if (!frozen_) {
            throw std::logic_error("endpoint served before freeze()");
        }
        auto* target = find_controller(controller);
        if (!target) {
            throw ConduitError(ErrorCode::UnknownAction, "no controller named \"" + controller + "\"");
        }

        co_await target->call(ctx, action);

        if (!ctx.committed()) {
            throw ConduitError(ErrorCode::NoResponse,
                               controller + "." + action + " finished without sending a response");
        }
    } catch (const ConduitError& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        crash = e.what();
    }

    auto& logger = default_logger();

    if (failure && failure->is_cancelled()) {
        logger.debug("Cancelled " + controller + "." + action);
        co_return Response(failure->http_status(), {}, "");
    }

    if (failure || crash) {
        auto entry = logger.entry(LogLevel::Error,
                                  failure ? failure->to_string() : "unhandled exception: " + *crash);
        entry.field("controller", controller)
             .field("action", action)
             .field("path", ctx.request().path());
        logger.log(entry);

        co_return error_response(ctx, failure ? failure->http_status() : 500);
    }

    co_return to_response(ctx);
}

} // namespace conduit
