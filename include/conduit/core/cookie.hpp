#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

enum class SameSite { None, Lax, Strict };

std::string_view same_site_name(SameSite value) noexcept;

// ============================================================================
// Cookie - one set-cookie header
// ============================================================================

struct Cookie {
    std::string name;
    std::string value;

    std::optional<std::string> domain;
    std::optional<std::string> path;
    std::optional<std::chrono::seconds> max_age;
    bool secure = false;
    bool http_only = false;
    SameSite same_site = SameSite::Lax;

    std::string to_header() const;

    // Tells the client to forget name; path must match the one it was set with
    static Cookie expired(std::string name, std::optional<std::string> path = std::nullopt);
};

// ============================================================================
// CookieJar - the request's cookie header
// ============================================================================

class CookieJar {
    std::map<std::string, std::string, std::less<>> cookies_;

public:
    // Malformed pairs are skipped; the first value sent for a name wins
    static CookieJar parse(std::string_view header);

    std::optional<std::string_view> get(std::string_view name) const;
    bool has(std::string_view name) const { return cookies_.find(name) != cookies_.end(); }

    std::vector<std::string> names() const;

    size_t size() const noexcept { return cookies_.size(); }
    bool empty() const noexcept { return cookies_.empty(); }
};

} // namespace conduit
