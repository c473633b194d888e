#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace conduit {

// ============================================================================
// HTTP Method
// ============================================================================

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    PATCH,
    HEAD,
    OPTIONS,
    CONNECT,
    TRACE,
    UNKNOWN
};

HttpMethod parse_method(std::string_view method) noexcept;
std::string_view method_to_string(HttpMethod method) noexcept;

// Percent-decoding with '+' as space, as used in query strings and forms
std::string url_decode(std::string_view input);

// ============================================================================
// Request
// ============================================================================

/// Inbound request as handed over by the router: transport fields plus the
/// parameters it extracted. Header names are stored lowercased.
class Request {
public:
    using Headers = std::unordered_map<std::string, std::string>;
    using Params = std::map<std::string, std::string, std::less<>>;

private:
    HttpMethod method_ = HttpMethod::GET;
    std::string path_;
    std::string query_string_;
    Headers headers_;
    Params query_params_;
    Params body_params_;
    Params path_params_;
    std::string body_;

public:
    Request() = default;
    Request(HttpMethod method, std::string path)
        : method_(method), path_(std::move(path)) {}

    // Accessors
    HttpMethod method() const noexcept { return method_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query_string() const noexcept { return query_string_; }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    const Params& query_params() const noexcept { return query_params_; }
    const Params& body_params() const noexcept { return body_params_; }
    const Params& path_params() const noexcept { return path_params_; }

    // Setters (router / transport)
    Request& set_method(HttpMethod m) { method_ = m; return *this; }
    Request& set_path(std::string p) { path_ = std::move(p); return *this; }
    Request& set_body(std::string b) { body_ = std::move(b); return *this; }

    // Replaces the query params with the decoded pairs of qs
    Request& set_query_string(std::string qs);

    Request& add_header(std::string_view key, std::string value);
    Request& add_query_param(std::string key, std::string value);
    Request& add_body_param(std::string key, std::string value);
    Request& add_path_param(std::string key, std::string value);

    // Case-insensitive header lookup
    std::optional<std::string_view> header(std::string_view key) const;

    std::optional<std::string_view> content_type() const {
        return header("content-type");
    }

    static Params parse_query(std::string_view query);
};

} // namespace conduit
