#pragma once

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "conduit/coro/cancellation.hpp"
#include "conduit/core/flash.hpp"
#include "conduit/core/mime.hpp"
#include "conduit/core/request.hpp"
#include "conduit/core/session.hpp"

namespace conduit {

struct TemplateEngine;

// ============================================================================
// Context - one request/response exchange
// ============================================================================

/// Carries everything a request accumulates on its way through a controller:
/// the router's request, response status/headers/body, template assigns,
/// negotiated format, session and flash.
///
/// A Context is owned by exactly one request at a time. Once committed, every
/// status, header or body mutation raises DoubleCommit.
class Context {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;
    using BeforeSend = std::function<void(Context&)>;

    // put_status() keeps symbolic names unresolved until commit
    using StatusValue = std::variant<int, std::string>;

private:
    Request request_;
    Request::Params params_;
    std::string controller_;
    std::string action_;

    std::optional<StatusValue> status_;
    Headers resp_headers_;
    std::string resp_body_;
    std::vector<BeforeSend> before_send_;

    nlohmann::json assigns_ = nlohmann::json::object();

    std::optional<std::string> format_;
    std::optional<std::string> format_override_;
    std::vector<std::string> accepted_formats_;
    std::string view_;
    std::optional<std::string> layout_;
    std::vector<std::string> layout_formats_{"html"};
    std::shared_ptr<const MimeTypes> mime_types_ = MimeTypes::builtin();
    std::shared_ptr<const TemplateEngine> templates_;

    std::shared_ptr<Session> session_;
    std::optional<FlashStore> flash_;
    std::unordered_map<std::string, std::any> private_;

    CancellationToken cancellation_;
    bool halted_ = false;
    bool committed_ = false;

    friend void commit(Context& ctx, std::string body);

    void ensure_open(std::string_view what) const;

public:
    explicit Context(Request request);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = default;
    Context& operator=(Context&&) = default;

    // ------------------------------------------------------------------------
    // Request side
    // ------------------------------------------------------------------------

    const Request& request() const noexcept { return request_; }

    /// Query, body and path params merged; path params win over body params,
    /// body params win over query params.
    const Request::Params& params() const noexcept { return params_; }
    std::optional<std::string_view> param(std::string_view key) const;

    const std::string& controller() const noexcept { return controller_; }
    const std::string& action() const noexcept { return action_; }
    Context& set_controller(std::string name) { controller_ = std::move(name); return *this; }
    Context& set_action(std::string name) { action_ = std::move(name); return *this; }

    // ------------------------------------------------------------------------
    // Response side
    // ------------------------------------------------------------------------

    /// Numeric status, nullopt while unset or when set to an unknown name.
    std::optional<int> status() const;
    bool has_status() const noexcept { return status_.has_value(); }
    const std::optional<StatusValue>& raw_status() const noexcept { return status_; }

    // Always accepted; the value is validated when the response is committed.
    Context& put_status(int code);
    Context& put_status(std::string_view name);

    const Headers& resp_headers() const noexcept { return resp_headers_; }
    std::optional<std::string_view> resp_header(std::string_view key) const;

    // Header names are lowercased. put_ replaces every value, add_ appends.
    Context& put_resp_header(std::string_view key, std::string value);
    Context& add_resp_header(std::string_view key, std::string value);
    Context& delete_resp_header(std::string_view key);

    Context& put_resp_content_type(std::string_view type,
                                   std::optional<std::string_view> charset = "utf-8");

    std::string_view resp_body() const noexcept { return resp_body_; }

    /// Runs once when the response is committed, before the context is
    /// sealed; callbacks run in reverse registration order.
    void register_before_send(BeforeSend callback);

    // ------------------------------------------------------------------------
    // Assigns
    // ------------------------------------------------------------------------

    Context& assign(const std::string& key, nlohmann::json value);
    const nlohmann::json& assigns() const noexcept { return assigns_; }

    // ------------------------------------------------------------------------
    // Rendering settings
    // ------------------------------------------------------------------------

    const std::optional<std::string>& format() const noexcept { return format_; }
    const std::optional<std::string>& format_override() const noexcept { return format_override_; }

    // Negotiated format (set by the accepts stage)
    Context& set_format(std::string format);

    // Explicit override; wins over negotiation
    Context& put_format(std::string format);

    // Empty means every format known to mime_types()
    const std::vector<std::string>& accepted_formats() const noexcept { return accepted_formats_; }
    Context& set_accepted_formats(std::vector<std::string> formats);

    const std::string& view() const noexcept { return view_; }
    Context& put_view(std::string view);

    // nullopt disables the layout
    const std::optional<std::string>& layout() const noexcept { return layout_; }
    Context& put_layout(std::optional<std::string> layout);

    const std::vector<std::string>& layout_formats() const noexcept { return layout_formats_; }
    Context& set_layout_formats(std::vector<std::string> formats);

    const MimeTypes& mime_types() const noexcept { return *mime_types_; }
    Context& set_mime_types(std::shared_ptr<const MimeTypes> types);

    const TemplateEngine* templates() const noexcept { return templates_.get(); }
    Context& set_templates(std::shared_ptr<const TemplateEngine> engine);

    // ------------------------------------------------------------------------
    // Session and flash
    // ------------------------------------------------------------------------

    bool has_session() const noexcept { return session_ != nullptr; }

    // Raise SessionNotFetched before the fetch_session stage ran
    Session& session();
    const Session& session() const;
    void set_session(std::shared_ptr<Session> session);

    bool has_flash() const noexcept { return flash_.has_value(); }

    // Raise FlashNotFetched before the fetch_flash stage ran
    FlashStore& flash();
    const FlashStore& flash() const;
    void set_flash(FlashStore flash);

    // ------------------------------------------------------------------------
    // Private storage (for stages)
    // ------------------------------------------------------------------------

    template<typename T> void put_private(const std::string& key, T value) {
        private_[key] = std::move(value);
    }

    template<typename T>
    std::optional<T> get_private(const std::string& key) const {
        auto it = private_.find(key);
        if (it == private_.end()) {
            return std::nullopt;
        }
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    bool has_private(const std::string& key) const {
        return private_.count(key) > 0;
    }

    // ------------------------------------------------------------------------
    // Flow control
    // ------------------------------------------------------------------------

    void set_cancellation(CancellationToken token) { cancellation_ = std::move(token); }
    bool is_cancelled() const noexcept { return cancellation_.is_cancelled(); }

    // Stops the remaining pipeline stages without sending anything
    void halt() noexcept { halted_ = true; }
    bool halted() const noexcept { return halted_; }

    bool committed() const noexcept { return committed_; }
};

// ============================================================================
// Flash helpers
// ============================================================================

inline void put_flash(Context& ctx, std::string key, std::string message) {
    ctx.flash().put(std::move(key), std::move(message));
}

inline std::optional<std::string> get_flash(const Context& ctx, std::string_view key) {
    return ctx.flash().get(key);
}

inline void clear_flash(Context& ctx) { ctx.flash().clear(); }

} // namespace conduit
