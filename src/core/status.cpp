#include "conduit/core/status.hpp"

#include <algorithm>
#include <array>

namespace conduit {

namespace {

struct StatusEntry {
    int code;
    std::string_view name;
    std::string_view phrase;
};

constexpr std::array<StatusEntry, 62> status_table{{
    // 1xx Informational
    {100, "continue", "Continue"},
    {101, "switching_protocols", "Switching Protocols"},
    {102, "processing", "Processing"},
    {103, "early_hints", "Early Hints"},

    // 2xx Success
    {200, "ok", "OK"},
    {201, "created", "Created"},
    {202, "accepted", "Accepted"},
    {203, "non_authoritative_information", "Non-Authoritative Information"},
    {204, "no_content", "No Content"},
    {205, "reset_content", "Reset Content"},
    {206, "partial_content", "Partial Content"},
    {207, "multi_status", "Multi-Status"},
    {208, "already_reported", "Already Reported"},
    {226, "im_used", "IM Used"},

    // 3xx Redirection
    {300, "multiple_choices", "Multiple Choices"},
    {301, "moved_permanently", "Moved Permanently"},
    {302, "found", "Found"},
    {303, "see_other", "See Other"},
    {304, "not_modified", "Not Modified"},
    {305, "use_proxy", "Use Proxy"},
    {306, "switch_proxy", "Switch Proxy"},
    {307, "temporary_redirect", "Temporary Redirect"},
    {308, "permanent_redirect", "Permanent Redirect"},

    // 4xx Client Errors
    {400, "bad_request", "Bad Request"},
    {401, "unauthorized", "Unauthorized"},
    {402, "payment_required", "Payment Required"},
    {403, "forbidden", "Forbidden"},
    {404, "not_found", "Not Found"},
    {405, "method_not_allowed", "Method Not Allowed"},
    {406, "not_acceptable", "Not Acceptable"},
    {407, "proxy_authentication_required", "Proxy Authentication Required"},
    {408, "request_timeout", "Request Timeout"},
    {409, "conflict", "Conflict"},
    {410, "gone", "Gone"},
    {411, "length_required", "Length Required"},
    {412, "precondition_failed", "Precondition Failed"},
    {413, "request_entity_too_large", "Request Entity Too Large"},
    {414, "request_uri_too_long", "Request-URI Too Long"},
    {415, "unsupported_media_type", "Unsupported Media Type"},
    {416, "requested_range_not_satisfiable", "Requested Range Not Satisfiable"},
    {417, "expectation_failed", "Expectation Failed"},
    {418, "im_a_teapot", "I'm a teapot"},
    {421, "misdirected_request", "Misdirected Request"},
    {422, "unprocessable_entity", "Unprocessable Entity"},
    {423, "locked", "Locked"},
    {424, "failed_dependency", "Failed Dependency"},
    {425, "too_early", "Too Early"},
    {426, "upgrade_required", "Upgrade Required"},
    {428, "precondition_required", "Precondition Required"},
    {429, "too_many_requests", "Too Many Requests"},
    {431, "request_header_fields_too_large", "Request Header Fields Too Large"},
    {451, "unavailable_for_legal_reasons", "Unavailable For Legal Reasons"},

    // 5xx Server Errors
    {500, "internal_server_error", "Internal Server Error"},
    {501, "not_implemented", "Not Implemented"},
    {502, "bad_gateway", "Bad Gateway"},
    {503, "service_unavailable", "Service Unavailable"},
    {504, "gateway_timeout", "Gateway Timeout"},
    {505, "http_version_not_supported", "HTTP Version Not Supported"},
    {506, "variant_also_negotiates", "Variant Also Negotiates"},
    {507, "insufficient_storage", "Insufficient Storage"},
    {508, "loop_detected", "Loop Detected"},
    {511, "network_authentication_required", "Network Authentication Required"},
}};

const StatusEntry* find_code(int code) noexcept {
    auto it = std::find_if(status_table.begin(), status_table.end(),
                           [code](const StatusEntry& e) { return e.code == code; });
    return it == status_table.end() ? nullptr : &*it;
}

} // anonymous namespace

bool is_known_status(int code) noexcept {
    return find_code(code) != nullptr;
}

std::optional<int> status_from_name(std::string_view name) noexcept {
    for (const auto& e : status_table) {
        if (e.name == name) return e.code;
    }
    return std::nullopt;
}

std::string_view status_name(int code) noexcept {
    const auto* e = find_code(code);
    return e ? e->name : std::string_view{};
}

std::string_view reason_phrase(int code) noexcept {
    const auto* e = find_code(code);
    return e ? e->phrase : std::string_view{"Unknown"};
}

} // namespace conduit
