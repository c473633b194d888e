#include "conduit/core/error.hpp"

#include <sstream>

namespace conduit {

namespace {

class ConduitErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "conduit";
    }

    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::DoubleCommit: return "Response already sent";
            case ErrorCode::InvalidStatus: return "Invalid status code";
            case ErrorCode::MisusedRedirect: return "Misused redirect";
            case ErrorCode::UnknownAction: return "Unknown action";
            case ErrorCode::SessionNotFetched: return "Session not fetched";
            case ErrorCode::FlashNotFetched: return "Flash not fetched";
            case ErrorCode::NoResponse: return "No response sent";
            case ErrorCode::TemplateNotFound: return "Template not found";
            case ErrorCode::TemplateRenderFailed: return "Template render failed";
            case ErrorCode::UnsupportedFormat: return "Unsupported format";
            case ErrorCode::Cancelled: return "Request cancelled";
            default: return "Unknown conduit error";
        }
    }
};

const ConduitErrorCategory category_instance{};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    return category_instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), error_category()};
}

// ============================================================================
// Error Factories
// ============================================================================

Error Error::double_commit(std::string_view what) {
    return Error(ErrorCode::DoubleCommit,
                 "cannot " + std::string(what) + ": the response was already sent");
}

Error Error::template_not_found(std::string_view key) {
    return Error(ErrorCode::TemplateNotFound, "could not find template \"" + std::string(key) + "\"");
}

Error Error::unsupported_format(std::string_view format, std::string_view accepted) {
    return Error(ErrorCode::UnsupportedFormat,
                 "format \"" + std::string(format) + "\" is not accepted (accepted: " +
                     std::string(accepted) + ")");
}

Error Error::invalid_status(std::string_view status) {
    return Error(ErrorCode::InvalidStatus, "unknown status \"" + std::string(status) + "\"");
}

Error Error::misused_redirect(std::string_view target, std::string_view reason) {
    return Error(ErrorCode::MisusedRedirect,
                 "cannot redirect to \"" + std::string(target) + "\": " + std::string(reason));
}

Error Error::cancelled() {
    return Error(ErrorCode::Cancelled, "client closed the request");
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "conduit::" << error_category().message(static_cast<int>(code_));
    if (!message_.empty()) {
        oss << " - " << message_;
    }
    return oss.str();
}

} // namespace conduit
