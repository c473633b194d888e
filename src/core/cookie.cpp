#include "conduit/core/cookie.hpp"

#include <cctype>

namespace conduit {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view strip(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

void append_attribute(std::string& out, std::string_view name, std::string_view value = {}) {
    out += "; ";
    out += name;
    if (!value.empty()) {
        out += '=';
        out += value;
    }
}

} // anonymous namespace

std::string_view same_site_name(SameSite value) noexcept {
    switch (value) {
        case SameSite::None: return "None";
        case SameSite::Lax: return "Lax";
        case SameSite::Strict: return "Strict";
    }
    return "Lax";
}

// ============================================================================
// Cookie
// ============================================================================

std::string Cookie::to_header() const {
    std::string out = name + "=" + value;

    if (domain) append_attribute(out, "Domain", *domain);
    if (path) append_attribute(out, "Path", *path);
    if (max_age) {
        append_attribute(out, "Max-Age", std::to_string(max_age->count()));
        // Older clients ignore Max-Age=0
        if (max_age->count() <= 0) {
            append_attribute(out, "Expires", "Thu, 01 Jan 1970 00:00:00 GMT");
        }
    }
    if (secure) append_attribute(out, "Secure");
    if (http_only) append_attribute(out, "HttpOnly");
    append_attribute(out, "SameSite", same_site_name(same_site));

    return out;
}

Cookie Cookie::expired(std::string name, std::optional<std::string> path) {
    Cookie cookie;
    cookie.name = std::move(name);
    cookie.path = std::move(path);
    cookie.max_age = std::chrono::seconds(0);
    return cookie;
}

// ============================================================================
// CookieJar
// ============================================================================

CookieJar CookieJar::parse(std::string_view header) {
    CookieJar jar;

    while (!header.empty()) {
        auto semi = header.find(';');
        auto pair = strip(header.substr(0, semi));
        header = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto name = strip(pair.substr(0, eq));
        auto value = strip(pair.substr(eq + 1));
        if (name.empty()) {
            continue;
        }
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        jar.cookies_.emplace(std::string(name), std::string(value));
    }

    return jar;
}

std::optional<std::string_view> CookieJar::get(std::string_view name) const {
    if (auto it = cookies_.find(name); it != cookies_.end()) {
        return std::string_view(it->second);
    }
    return std::nullopt;
}

std::vector<std::string> CookieJar::names() const {
    std::vector<std::string> result;
    result.reserve(cookies_.size());
    for (const auto& [name, _] : cookies_) {
        result.push_back(name);
    }
    return result;
}

} // namespace conduit
