#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conduit {

// Built-in response formats
namespace formats {
inline constexpr std::string_view html = "html";
inline constexpr std::string_view json = "json";
inline constexpr std::string_view text = "text";
inline constexpr std::string_view xml = "xml";
} // namespace formats

// ============================================================================
// MimeTypes - format name <-> content type
// ============================================================================

/// Formats are plain names ("html", "json") so applications can add their
/// own ("csv", "ics") next to the built-ins. A table is built once at startup
/// and shared read-only by every request.
class MimeTypes {
    std::unordered_map<std::string, std::string> by_format_;
    std::unordered_map<std::string, std::string> by_type_;
    std::vector<std::string> order_;

public:
    // html, json, text, xml
    MimeTypes();

    static std::shared_ptr<const MimeTypes> builtin();

    // Later registrations of the same format replace its content type;
    // an existing content type keeps pointing at its first format.
    MimeTypes& register_format(std::string format, std::string content_type);

    std::optional<std::string_view> content_type(std::string_view format) const;

    // Parameters (";charset=...") are ignored; matching is case-insensitive.
    std::optional<std::string_view> format_for(std::string_view content_type) const;

    // "report.csv" -> "csv" when csv is registered
    std::optional<std::string_view> format_for_filename(std::string_view filename) const;

    bool knows(std::string_view format) const;

    // Registration order
    const std::vector<std::string>& formats() const noexcept { return order_; }
};

// text/* and application/json style types get "; charset=utf-8" appended
bool is_textual_content_type(std::string_view content_type) noexcept;

} // namespace conduit
