#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Fatal: programming errors, the request is answered with a 500
    DoubleCommit = 1,
    InvalidStatus,
    MisusedRedirect,
    UnknownAction,
    SessionNotFetched,
    FlashNotFetched,
    NoResponse,

    // Reportable: handled by an action fallback or turned into an error response
    TemplateNotFound,
    TemplateRenderFailed,
    UnsupportedFormat,

    // Client went away; the request is dropped without a response
    Cancelled
};

} // namespace conduit

template<>
struct std::is_error_code_enum<conduit::ErrorCode> : std::true_type {};

namespace conduit {

const std::error_category& error_category() noexcept;
std::error_code make_error_code(ErrorCode e) noexcept;

// ============================================================================
// Error
// ============================================================================

class Error {
    ErrorCode code_ = ErrorCode::NoResponse;
    std::string message_;

public:
    Error() = default;

    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    static Error double_commit(std::string_view what);
    static Error template_not_found(std::string_view key);
    static Error unsupported_format(std::string_view format, std::string_view accepted);
    static Error invalid_status(std::string_view status);
    static Error misused_redirect(std::string_view target, std::string_view reason);
    static Error cancelled();

    ErrorCode code() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }
    std::error_code error_code() const noexcept { return make_error_code(code_); }

    bool is_fatal() const noexcept {
        return code_ >= ErrorCode::DoubleCommit && code_ <= ErrorCode::NoResponse;
    }

    bool is_reportable() const noexcept {
        return code_ >= ErrorCode::TemplateNotFound && code_ <= ErrorCode::UnsupportedFormat;
    }

    bool is_cancelled() const noexcept { return code_ == ErrorCode::Cancelled; }

    // HTTP status used when the error is turned into a response
    int http_status() const noexcept {
        switch (code_) {
            case ErrorCode::TemplateNotFound: return 404;
            case ErrorCode::UnsupportedFormat: return 406;
            case ErrorCode::Cancelled: return 499; // Client Closed Request
            default: return 500;
        }
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }
};

// ============================================================================
// ConduitError - exception carrying an Error
// ============================================================================

class ConduitError : public std::runtime_error {
    Error error_;

public:
    explicit ConduitError(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    ConduitError(ErrorCode code, std::string message)
        : ConduitError(Error(code, std::move(message))) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code(); }
};

} // namespace conduit
