#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "conduit/controller/controller.hpp"
#include "conduit/core/config.hpp"
#include "conduit/core/context.hpp"
#include "conduit/core/mime.hpp"
#include "conduit/core/request.hpp"
#include "conduit/core/response.hpp"
#include "conduit/core/session.hpp"
#include "conduit/coro/cancellation.hpp"
#include "conduit/coro/task.hpp"
#include "conduit/view/template_engine.hpp"

namespace conduit {

// ============================================================================
// Endpoint - entry point the router hands requests to
// ============================================================================

/// Owns the shared collaborators (template engine, session store, format
/// table) and the controllers by name. Configure, then freeze(); serve() may
/// then be called from any number of threads.
class Endpoint {
    EndpointConfig config_;
    std::shared_ptr<const TemplateEngine> templates_;
    std::shared_ptr<SessionStore> sessions_;
    SessionOptions session_options_;
    std::shared_ptr<MimeTypes> mime_types_;
    std::unordered_map<std::string, std::unique_ptr<Controller>> controllers_;
    bool frozen_ = false;

    Controller& add_controller(const std::string& name, ControllerOptions options);

public:
    explicit Endpoint(EndpointConfig config = {});

    const EndpointConfig& config() const noexcept { return config_; }

    // Controller using the configured accepted formats and default layout
    Controller& controller(const std::string& name);
    Controller& controller(const std::string& name, ControllerOptions options);

    Controller* find_controller(const std::string& name) const;

    // Defaults to an InjaTemplateEngine over config().template_dir
    Endpoint& set_templates(std::shared_ptr<const TemplateEngine> engine);
    const TemplateEngine& templates() const noexcept { return *templates_; }

    // Defaults to a MemorySessionStore
    Endpoint& set_session_store(std::shared_ptr<SessionStore> store);
    const std::shared_ptr<SessionStore>& session_store() const noexcept { return sessions_; }
    const SessionOptions& session_options() const noexcept { return session_options_; }

    // Register custom formats here before freeze()
    MimeTypes& mime_types();

    // Freezes every controller
    void freeze();
    bool frozen() const noexcept { return frozen_; }

    /// Runs action on the named controller and returns the committed
    /// response. Fatal errors are logged and answered with a 500; a request
    /// that ends without a response is a NoResponse error; a cancelled
    /// request yields an uncommitted 499 marker.
    Task<Response> serve(Request request, std::string controller, std::string action,
                         CancellationToken cancellation = {}) const;

    // Same, on a caller-owned context
    Task<Response> serve(Context& ctx, std::string controller, std::string action) const;
};

} // namespace conduit
