#pragma once

#include <optional>
#include <string_view>

namespace conduit {

// Recognized HTTP status codes. put_status() accepts anything; the
// finalizer checks the value against this table when the response is sent.

bool is_known_status(int code) noexcept;

// Symbolic name ("not_found", "created", ...) to numeric code
std::optional<int> status_from_name(std::string_view name) noexcept;

// Symbolic name for a known code, empty otherwise
std::string_view status_name(int code) noexcept;

// "Not Found" for 404, "Unknown" for codes outside the table
std::string_view reason_phrase(int code) noexcept;

inline bool is_redirect_status(int code) noexcept {
    return code >= 300 && code <= 308;
}

} // namespace conduit
