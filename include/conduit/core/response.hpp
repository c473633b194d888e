#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit {

// ============================================================================
// Response
// ============================================================================

/// Finalized status, headers and body handed to the transport. Built from a
/// committed Context; a Response is never mutated by the pipeline.
class Response {
public:
    using Header = std::pair<std::string, std::string>;
    using Headers = std::vector<Header>;

private:
    int status_ = 200;
    Headers headers_;
    std::string body_;

public:
    Response() = default;

    Response(int status, Headers headers, std::string body)
        : status_(status)
        , headers_(std::move(headers))
        , body_(std::move(body)) {}

    int status() const noexcept { return status_; }
    std::string_view status_text() const noexcept;
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    // First value of a header, case-insensitive
    std::optional<std::string_view> header(std::string_view key) const;

    // All values of a header (set-cookie may repeat)
    std::vector<std::string_view> header_values(std::string_view key) const;

    // HTTP/1.1 wire form
    std::string serialize() const;

    // Plain-text response produced outside a Context (fatal errors, cancellation)
    static Response plain(int status, std::string body);

    static Response internal_error(std::string body = "Internal Server Error") {
        return plain(500, std::move(body));
    }
};

} // namespace conduit
