#include "conduit/controller/controller.hpp"

#include "conduit/core/logging.hpp"
#include "conduit/core/status.hpp"
#include "conduit/view/render.hpp"

#include <stdexcept>

namespace conduit {

namespace {

constexpr std::string_view dispatch_stage = "dispatch";

} // anonymous namespace

Controller::Controller(std::string name, ControllerOptions options)
    : name_(std::move(name))
    , options_(std::move(options))
{
    if (options_.view.empty()) {
        options_.view = name_;
    }
}

void Controller::ensure_mutable(std::string_view what) const {
    if (frozen_) {
        throw std::logic_error("controller \"" + name_ + "\": cannot " + std::string(what) +
                               " after freeze()");
    }
}

// ============================================================================
// Registration
// ============================================================================

Controller& Controller::action(std::string name, ActionFn fn) {
    ensure_mutable("register an action");
    if (!fn) {
        throw std::invalid_argument("action \"" + name + "\" has no function");
    }
    if (actions_.count(name) > 0) {
        throw std::logic_error("controller \"" + name_ + "\": action \"" + name +
                               "\" registered twice");
    }
    actions_.emplace(std::move(name), std::move(fn));
    return *this;
}

Controller& Controller::plug(std::string name, StageFn fn, ActionGuard guard) {
    ensure_mutable("plug a stage");
    pipeline_.add(std::move(name), std::move(fn), std::move(guard));
    return *this;
}

Controller& Controller::plug_dispatch(ActionGuard guard) {
    return plug(std::string(dispatch_stage),
                [this](Context& ctx) { return dispatch(ctx); },
                std::move(guard));
}

Controller& Controller::plug_auto_render(ActionGuard guard) {
    return plug("auto_render",
                [](Context& ctx) -> Task<void> {
                    render(ctx);
                    co_return;
                },
                std::move(guard));
}

Controller& Controller::fallback(FallbackFn fn) {
    ensure_mutable("set the fallback");
    fallback_ = std::move(fn);
    return *this;
}

Controller& Controller::set_templates(std::shared_ptr<const TemplateEngine> engine) {
    ensure_mutable("set the template engine");
    templates_ = std::move(engine);
    return *this;
}

void Controller::freeze() {
    if (frozen_) {
        return;
    }
    if (!pipeline_.contains(dispatch_stage)) {
        throw std::logic_error("controller \"" + name_ + "\" has no dispatch stage");
    }
    for (const auto& stage : pipeline_.stages()) {
        for (const auto& name : stage.guard.actions()) {
            if (!has_action(name)) {
                throw std::logic_error("controller \"" + name_ + "\": stage \"" + stage.name +
                                       "\" names unknown action \"" + name + "\"");
            }
        }
    }
    frozen_ = true;
}

// ============================================================================
// Request handling
// ============================================================================

bool Controller::has_action(std::string_view name) const {
    return actions_.find(name) != actions_.end();
}

std::vector<std::string> Controller::actions() const {
    std::vector<std::string> names;
    names.reserve(actions_.size());
    for (const auto& [name, _] : actions_) {
        names.push_back(name);
    }
    return names;
}

Task<void> Controller::call(Context& ctx, std::string action) const {
    if (!frozen_) {
        throw std::logic_error("controller \"" + name_ + "\" called before freeze()");
    }
    if (!has_action(action)) {
        throw ConduitError(ErrorCode::UnknownAction,
                           "controller \"" + name_ + "\" has no action \"" + action + "\"");
    }

    ctx.set_controller(name_);
    ctx.set_action(action);
    if (ctx.view().empty()) {
        ctx.put_view(options_.view);
    }
    if (!options_.accepted_formats.empty()) {
        ctx.set_accepted_formats(options_.accepted_formats);
    }
    ctx.put_layout(options_.layout);
    ctx.set_layout_formats(options_.layout_formats);
    ctx.set_mime_types(options_.mime_types);
    if (templates_) {
        ctx.set_templates(templates_);
    }

    auto& logger = default_logger();
    if (logger.is_enabled(LogLevel::Debug)) {
        auto entry = logger.entry(LogLevel::Debug, "Processing by " + name_ + "." + action);
        nlohmann::json params(ctx.params());
        entry.field("params", params.dump());
        if (ctx.format()) {
            entry.field("format", *ctx.format());
        }
        logger.log(entry);
    }

    std::optional<Error> failure;
    try {
        co_await pipeline_.run(ctx, action);
    } catch (const ConduitError& e) {
        if (!e.error().is_reportable()) {
            throw;
        }
        failure = e.error();
    }

    if (failure) {
        co_await handle_reportable(ctx, std::move(*failure));
    }
}

Task<void> Controller::dispatch(Context& ctx) const {
    auto it = actions_.find(ctx.action());
    if (it == actions_.end()) {
        throw ConduitError(ErrorCode::UnknownAction,
                           "controller \"" + name_ + "\" has no action \"" + ctx.action() + "\"");
    }
    co_await it->second(ctx);
}

Task<void> Controller::handle_reportable(Context& ctx, Error error) const {
    if (ctx.committed()) {
        throw ConduitError(std::move(error));
    }

    if (fallback_) {
        co_await fallback_(ctx, error);
        co_return;
    }

    log_warn(name_ + "." + ctx.action() + ": " + error.to_string());

    int status = error.http_status();
    ctx.put_status(status);
    ctx.delete_resp_header("content-type");
    text(ctx, std::to_string(status) + " " + std::string(reason_phrase(status)) + ": " +
                  error_category().message(static_cast<int>(error.code())));
}

} // namespace conduit
