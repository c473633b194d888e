#include "conduit/core/context.hpp"

#include "conduit/core/error.hpp"
#include "conduit/core/status.hpp"

#include <algorithm>
#include <cctype>

namespace conduit {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

Context::Context(Request request) : request_(std::move(request)) {
    // Lowest precedence first; later inserts overwrite
    for (const auto& [key, value] : request_.query_params()) {
        params_[key] = value;
    }
    for (const auto& [key, value] : request_.body_params()) {
        params_[key] = value;
    }
    for (const auto& [key, value] : request_.path_params()) {
        params_[key] = value;
    }
}

std::optional<std::string_view> Context::param(std::string_view key) const {
    auto it = params_.find(key);
    if (it == params_.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

void Context::ensure_open(std::string_view what) const {
    if (committed_) {
        throw ConduitError(Error::double_commit(what));
    }
}

// ============================================================================
// Status
// ============================================================================

std::optional<int> Context::status() const {
    if (!status_) {
        return std::nullopt;
    }
    if (const int* code = std::get_if<int>(&*status_)) {
        return *code;
    }
    return status_from_name(std::get<std::string>(*status_));
}

Context& Context::put_status(int code) {
    ensure_open("set the status");
    status_ = code;
    return *this;
}

Context& Context::put_status(std::string_view name) {
    ensure_open("set the status");
    status_ = std::string(name);
    return *this;
}

// ============================================================================
// Headers
// ============================================================================

std::optional<std::string_view> Context::resp_header(std::string_view key) const {
    auto name = to_lower(key);
    for (const auto& [k, v] : resp_headers_) {
        if (k == name) {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

Context& Context::put_resp_header(std::string_view key, std::string value) {
    ensure_open("set a response header");
    auto name = to_lower(key);
    std::erase_if(resp_headers_, [&](const auto& h) { return h.first == name; });
    resp_headers_.emplace_back(std::move(name), std::move(value));
    return *this;
}

Context& Context::add_resp_header(std::string_view key, std::string value) {
    ensure_open("add a response header");
    resp_headers_.emplace_back(to_lower(key), std::move(value));
    return *this;
}

Context& Context::delete_resp_header(std::string_view key) {
    ensure_open("delete a response header");
    auto name = to_lower(key);
    std::erase_if(resp_headers_, [&](const auto& h) { return h.first == name; });
    return *this;
}

Context& Context::put_resp_content_type(std::string_view type,
                                        std::optional<std::string_view> charset) {
    std::string value(type);
    if (charset && !charset->empty()) {
        value += "; charset=";
        value += *charset;
    }
    return put_resp_header("content-type", std::move(value));
}

void Context::register_before_send(BeforeSend callback) {
    ensure_open("register a before-send callback");
    before_send_.push_back(std::move(callback));
}

// ============================================================================
// Assigns and rendering settings
// ============================================================================

Context& Context::assign(const std::string& key, nlohmann::json value) {
    assigns_[key] = std::move(value);
    return *this;
}

Context& Context::set_format(std::string format) {
    format_ = std::move(format);
    return *this;
}

Context& Context::put_format(std::string format) {
    format_override_ = std::move(format);
    return *this;
}

Context& Context::set_accepted_formats(std::vector<std::string> formats) {
    accepted_formats_ = std::move(formats);
    return *this;
}

Context& Context::put_view(std::string view) {
    view_ = std::move(view);
    return *this;
}

Context& Context::put_layout(std::optional<std::string> layout) {
    layout_ = std::move(layout);
    return *this;
}

Context& Context::set_layout_formats(std::vector<std::string> formats) {
    layout_formats_ = std::move(formats);
    return *this;
}

Context& Context::set_mime_types(std::shared_ptr<const MimeTypes> types) {
    if (types) {
        mime_types_ = std::move(types);
    }
    return *this;
}

Context& Context::set_templates(std::shared_ptr<const TemplateEngine> engine) {
    templates_ = std::move(engine);
    return *this;
}

// ============================================================================
// Session and flash
// ============================================================================

Session& Context::session() {
    if (!session_) {
        throw ConduitError(ErrorCode::SessionNotFetched,
                           "session accessed before the fetch_session stage");
    }
    return *session_;
}

const Session& Context::session() const {
    if (!session_) {
        throw ConduitError(ErrorCode::SessionNotFetched,
                           "session accessed before the fetch_session stage");
    }
    return *session_;
}

void Context::set_session(std::shared_ptr<Session> session) {
    session_ = std::move(session);
}

FlashStore& Context::flash() {
    if (!flash_) {
        throw ConduitError(ErrorCode::FlashNotFetched,
                           "flash accessed before the fetch_flash stage");
    }
    return *flash_;
}

const FlashStore& Context::flash() const {
    if (!flash_) {
        throw ConduitError(ErrorCode::FlashNotFetched,
                           "flash accessed before the fetch_flash stage");
    }
    return *flash_;
}

void Context::set_flash(FlashStore flash) { flash_ = std::move(flash); }

} // namespace conduit
