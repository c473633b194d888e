#include "conduit/view/render.hpp"

#include "conduit/core/error.hpp"
#include "conduit/core/finalizer.hpp"
#include "conduit/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace conduit {

namespace {

struct AcceptEntry {
    std::string type;
    double q = 1.0;
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// "text/html;q=0.9, */*;q=0.1" ordered by q, ties in header order
std::vector<AcceptEntry> parse_accept(std::string_view header) {
    std::vector<AcceptEntry> entries;

    size_t start = 0;
    while (start <= header.size()) {
        size_t end = header.find(',', start);
        if (end == std::string_view::npos) {
            end = header.size();
        }
        auto part = trim(header.substr(start, end - start));
        start = end + 1;

        if (part.empty()) {
            continue;
        }

        AcceptEntry entry;
        auto semi = part.find(';');
        entry.type = to_lower(trim(part.substr(0, semi)));

        while (semi != std::string_view::npos) {
            auto next = part.find(';', semi + 1);
            auto param = trim(part.substr(semi + 1, next == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : next - semi - 1));
            if (param.starts_with("q=")) {
                entry.q = std::strtod(std::string(param.substr(2)).c_str(), nullptr);
            }
            semi = next;
        }

        if (entry.q > 0.0) {
            entries.push_back(std::move(entry));
        }
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const AcceptEntry& a, const AcceptEntry& b) { return a.q > b.q; });
    return entries;
}

bool contains(const std::vector<std::string>& formats, std::string_view format) {
    return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string default_format(const std::vector<std::string>& accepted) {
    if (accepted.empty() || contains(accepted, formats::html)) {
        return std::string(formats::html);
    }
    return accepted.front();
}

std::string join(const std::vector<std::string>& formats) {
    std::string out;
    for (const auto& f : formats) {
        if (!out.empty()) {
            out += ", ";
        }
        out += f;
    }
    return out;
}

void put_default_content_type(Context& ctx, std::string_view format) {
    if (ctx.resp_header("content-type")) {
        return;
    }
    auto type = ctx.mime_types().content_type(format);
    if (!type) {
        ctx.put_resp_content_type("application/octet-stream", std::nullopt);
        return;
    }
    if (is_textual_content_type(*type)) {
        ctx.put_resp_content_type(*type);
    } else {
        ctx.put_resp_content_type(*type, std::nullopt);
    }
}

// "show.html" -> {"show", "html"}; no extension after the last slash -> nullopt
std::optional<std::pair<std::string_view, std::string_view>>
split_extension(std::string_view template_ref) {
    auto dot = template_ref.rfind('.');
    auto slash = template_ref.rfind('/');
    if (dot == std::string_view::npos || dot + 1 >= template_ref.size()) {
        return std::nullopt;
    }
    if (slash != std::string_view::npos && dot < slash) {
        return std::nullopt;
    }
    return std::make_pair(template_ref.substr(0, dot), template_ref.substr(dot + 1));
}

} // anonymous namespace

// ============================================================================
// Format negotiation
// ============================================================================

std::vector<std::string> accepted_formats(const Context& ctx) {
    if (!ctx.accepted_formats().empty()) {
        return ctx.accepted_formats();
    }
    return ctx.mime_types().formats();
}

std::string negotiate_format(const Context& ctx, const std::vector<std::string>& accepted) {
    const auto& query = ctx.request().query_params();
    if (auto it = query.find("_format"); it != query.end() && !it->second.empty()) {
        return to_lower(it->second);
    }

    auto header = ctx.request().header("accept");
    if (!header) {
        return default_format(accepted);
    }

    std::optional<std::string> first_named;
    for (const auto& entry : parse_accept(*header)) {
        if (entry.type == "*/*" || entry.type == "*") {
            return default_format(accepted);
        }

        if (entry.type.ends_with("/*")) {
            // "text/*" picks the first accepted format of that family
            auto family = std::string_view(entry.type).substr(0, entry.type.size() - 1);
            for (const auto& format : accepted) {
                auto type = ctx.mime_types().content_type(format);
                if (type && type->starts_with(family)) {
                    return format;
                }
            }
            continue;
        }

        auto format = ctx.mime_types().format_for(entry.type);
        if (!format) {
            continue;
        }
        if (contains(accepted, *format)) {
            return std::string(*format);
        }
        if (!first_named) {
            first_named = std::string(*format);
        }
    }

    if (first_named) {
        return *first_named;
    }
    return default_format(accepted);
}

std::string resolve_format(const Context& ctx) {
    if (ctx.format_override()) {
        return *ctx.format_override();
    }

    auto accepted = accepted_formats(ctx);
    auto format = ctx.format() ? *ctx.format() : negotiate_format(ctx, accepted);
    if (!contains(accepted, format)) {
        throw ConduitError(Error::unsupported_format(format, join(accepted)));
    }
    return format;
}

// ============================================================================
// Render
// ============================================================================

void render(Context& ctx) {
    render(ctx, ctx.action(), nlohmann::json::object());
}

void render(Context& ctx, std::string_view template_ref) {
    render(ctx, template_ref, nlohmann::json::object());
}

void render(Context& ctx, std::string_view template_ref, const nlohmann::json& assigns) {
    if (ctx.committed()) {
        throw ConduitError(Error::double_commit("render \"" + std::string(template_ref) + "\""));
    }

    TemplateKey key;
    key.view = ctx.view();

    // The request must be acceptable even when the template names its format
    auto format = resolve_format(ctx);

    if (auto parts = split_extension(template_ref)) {
        key.name = std::string(parts->first);
        key.format = std::string(parts->second);
        if (!ctx.format_override()) {
            auto accepted = accepted_formats(ctx);
            if (!contains(accepted, key.format)) {
                throw ConduitError(Error::unsupported_format(key.format, join(accepted)));
            }
        }
    } else {
        key.name = std::string(template_ref);
        key.format = std::move(format);
    }

    const TemplateEngine* engine = ctx.templates();
    if (!engine) {
        throw ConduitError(Error::template_not_found(key.path()));
    }

    nlohmann::json merged = ctx.assigns();
    if (assigns.is_object()) {
        merged.update(assigns);
    }
    if (!merged.contains("flash")) {
        merged["flash"] = ctx.has_flash() ? ctx.flash().to_json() : nlohmann::json::object();
    }

    auto body = engine->render(key, merged);
    if (!body) {
        throw ConduitError(Error::template_not_found(key.path()));
    }

    const auto& layout = ctx.layout();
    if (layout && contains(ctx.layout_formats(), key.format)) {
        TemplateKey layout_key{"", *layout, key.format};
        merged["inner_content"] = std::move(*body);
        body = engine->render(layout_key, merged);
        if (!body) {
            throw ConduitError(Error::template_not_found(layout_key.path()));
        }
    }

    log_debug("Rendered " + key.path());

    put_default_content_type(ctx, key.format);
    commit(ctx, std::move(*body));
}

// ============================================================================
// Direct bodies
// ============================================================================

void text(Context& ctx, std::string_view body) {
    if (!ctx.resp_header("content-type")) {
        ctx.put_resp_content_type("text/plain");
    }
    commit(ctx, std::string(body));
}

void html(Context& ctx, std::string_view body) {
    if (!ctx.resp_header("content-type")) {
        ctx.put_resp_content_type("text/html");
    }
    commit(ctx, std::string(body));
}

void json(Context& ctx, const nlohmann::json& value) {
    if (!ctx.resp_header("content-type")) {
        ctx.put_resp_content_type("application/json");
    }
    commit(ctx, value.dump());
}

void send_download(Context& ctx, std::string data, std::string_view filename,
                   std::optional<std::string_view> content_type) {
    std::string type;
    if (content_type) {
        type = std::string(*content_type);
    } else if (auto format = ctx.mime_types().format_for_filename(filename)) {
        type = std::string(*ctx.mime_types().content_type(*format));
    } else {
        type = "application/octet-stream";
    }

    ctx.put_resp_content_type(type, std::nullopt);

    std::string disposition = "attachment; filename=\"";
    for (char c : filename) {
        if (c == '"' || c == '\\') {
            disposition += '\\';
        }
        disposition += c;
    }
    disposition += '"';
    ctx.put_resp_header("content-disposition", std::move(disposition));

    commit(ctx, std::move(data));
}

} // namespace conduit
