#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/core/context.hpp"
#include "conduit/core/error.hpp"
#include "conduit/core/mime.hpp"
#include "conduit/coro/task.hpp"
#include "conduit/pipeline/pipeline.hpp"
#include "conduit/view/template_engine.hpp"

namespace conduit {

// ============================================================================
// Controller Options
// ============================================================================

struct ControllerOptions {
    // Template namespace; defaults to the controller name
    std::string view;

    // Formats render() may produce; empty accepts every known format
    std::vector<std::string> accepted_formats;

    // Layout template ("layouts/app"); nullopt renders without one
    std::optional<std::string> layout;

    // Formats wrapped in the layout
    std::vector<std::string> layout_formats{"html"};

    // Format table; the endpoint's (or the built-in) table when null
    std::shared_ptr<const MimeTypes> mime_types;
};

// Actions are coroutines so they may await I/O
using ActionFn = std::function<Task<void>(Context&)>;

// Receives reportable errors (template miss, unsupported format) raised by
// the pipeline; it is expected to send a response
using FallbackFn = std::function<Task<void>(Context&, const Error&)>;

// ============================================================================
// Controller
// ============================================================================

/// A named set of actions behind one stage pipeline.
///
/// Actions and stages are registered once, then freeze() validates the chain
/// and the controller becomes read-only; call() may then run concurrently
/// for independent requests.
///
///   Controller page("page", {.accepted_formats = {"html", "text"}});
///   page.action("index", [](Context& ctx) -> Task<void> { co_return; })
///       .plug("accepts", stages::accepts({"html", "text"}))
///       .plug_dispatch()
///       .plug_auto_render(only({"index"}))
///       .freeze();
class Controller {
    std::string name_;
    ControllerOptions options_;
    std::map<std::string, ActionFn, std::less<>> actions_;
    Pipeline pipeline_;
    FallbackFn fallback_;
    std::shared_ptr<const TemplateEngine> templates_;
    bool frozen_ = false;

    void ensure_mutable(std::string_view what) const;
    Task<void> handle_reportable(Context& ctx, Error error) const;

public:
    explicit Controller(std::string name, ControllerOptions options = {});

    // Stages capture this controller
    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    const std::string& name() const noexcept { return name_; }
    const ControllerOptions& options() const noexcept { return options_; }
    const Pipeline& pipeline() const noexcept { return pipeline_; }
    bool frozen() const noexcept { return frozen_; }

    // ------------------------------------------------------------------------
    // Registration (before freeze)
    // ------------------------------------------------------------------------

    Controller& action(std::string name, ActionFn fn);

    Controller& plug(std::string name, StageFn fn, ActionGuard guard = ActionGuard::always());

    // Stage that runs the resolved action
    Controller& plug_dispatch(ActionGuard guard = ActionGuard::always());

    // Stage that renders <view>/<action>.<format> when nothing was sent
    Controller& plug_auto_render(ActionGuard guard = ActionGuard::always());

    Controller& fallback(FallbackFn fn);

    // Replaces the endpoint's engine for this controller's requests
    Controller& set_templates(std::shared_ptr<const TemplateEngine> engine);

    /// Validates the chain: a dispatch stage exists and every action named by
    /// a guard is registered. Throws std::logic_error otherwise.
    void freeze();

    // ------------------------------------------------------------------------
    // Request handling (after freeze)
    // ------------------------------------------------------------------------

    bool has_action(std::string_view name) const;
    std::vector<std::string> actions() const;

    /// Runs the pipeline for action. Reportable errors go to the fallback or
    /// become an error response; fatal errors and cancellation propagate.
    /// Throws UnknownAction for an unregistered action.
    Task<void> call(Context& ctx, std::string action) const;

    // Runs the action named by ctx.action()
    Task<void> dispatch(Context& ctx) const;
};

} // namespace conduit
