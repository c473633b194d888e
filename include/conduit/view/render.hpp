#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "conduit/core/context.hpp"
#include "conduit/view/template_engine.hpp"

namespace conduit {

// ============================================================================
// Format negotiation
// ============================================================================

// ctx.accepted_formats(), or every format ctx.mime_types() knows when unset
std::vector<std::string> accepted_formats(const Context& ctx);

/// Format the client asked for: the "_format" query parameter, else the best
/// Accept entry by q-value that maps to an accepted format, else the default
/// (html when accepted, the first accepted format otherwise). A request that
/// names only formats outside accepted yields the first one it names, so the
/// caller can refuse it.
std::string negotiate_format(const Context& ctx, const std::vector<std::string>& accepted);

/// Format a render call uses: the put_format() override, else the negotiated
/// format. Throws UnsupportedFormat when the negotiated format is not
/// accepted.
std::string resolve_format(const Context& ctx);

// ============================================================================
// Rendering settings
// ============================================================================

inline void put_view(Context& ctx, std::string view) { ctx.put_view(std::move(view)); }

// nullopt renders without a layout
inline void put_layout(Context& ctx, std::optional<std::string> layout) {
    ctx.put_layout(std::move(layout));
}

inline void put_format(Context& ctx, std::string format) { ctx.put_format(std::move(format)); }

// ============================================================================
// Render
// ============================================================================

/// Renders the template implied by the action: <view>/<action>.<format>.
void render(Context& ctx);

/// Renders template_ref ("show" or "show.html"; an extension picks the
/// template's format) with ctx.assigns() merged with assigns, wraps it in the
/// layout for layout formats and commits the response (status 200 unless set).
///
/// Without a put_format() override both the negotiated format and the
/// extension must be accepted. Throws DoubleCommit when ctx is committed,
/// UnsupportedFormat before any template lookup, TemplateNotFound naming the
/// missing resource.
void render(Context& ctx, std::string_view template_ref);
void render(Context& ctx, std::string_view template_ref, const nlohmann::json& assigns);

// ============================================================================
// Direct bodies
// ============================================================================

// Content type defaults to text/plain, text/html and application/json.
void text(Context& ctx, std::string_view body);
void html(Context& ctx, std::string_view body);
void json(Context& ctx, const nlohmann::json& value);

/// Sends data as an attachment named filename. The content type comes from
/// the file extension unless given.
void send_download(Context& ctx, std::string data, std::string_view filename,
                   std::optional<std::string_view> content_type = std::nullopt);

} // namespace conduit
