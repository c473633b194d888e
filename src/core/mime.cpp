#include "conduit/core/mime.hpp"

#include <algorithm>
#include <cctype>

namespace conduit {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view strip_params(std::string_view type) {
    auto semi = type.find(';');
    if (semi != std::string_view::npos) {
        type = type.substr(0, semi);
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.remove_suffix(1);
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front()))) {
        type.remove_prefix(1);
    }
    return type;
}

} // anonymous namespace

MimeTypes::MimeTypes() {
    register_format("html", "text/html");
    register_format("json", "application/json");
    register_format("text", "text/plain");
    register_format("xml", "application/xml");
    by_type_.emplace("text/xml", "xml");
}

std::shared_ptr<const MimeTypes> MimeTypes::builtin() {
    static const auto table = std::make_shared<const MimeTypes>();
    return table;
}

MimeTypes& MimeTypes::register_format(std::string format, std::string content_type) {
    auto type = to_lower(content_type);
    if (by_format_.find(format) == by_format_.end()) {
        order_.push_back(format);
    }
    by_type_.emplace(type, format);
    by_format_[std::move(format)] = std::move(type);
    return *this;
}

std::optional<std::string_view> MimeTypes::content_type(std::string_view format) const {
    auto it = by_format_.find(std::string(format));
    if (it == by_format_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string_view> MimeTypes::format_for(std::string_view content_type) const {
    auto it = by_type_.find(to_lower(strip_params(content_type)));
    if (it == by_type_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string_view> MimeTypes::format_for_filename(std::string_view filename) const {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == filename.size()) {
        return std::nullopt;
    }
    auto ext = to_lower(filename.substr(dot + 1));
    if (ext == "txt") ext = "text";
    if (ext == "htm") ext = "html";
    auto it = by_format_.find(ext);
    if (it == by_format_.end()) return std::nullopt;
    return std::string_view(it->first);
}

bool MimeTypes::knows(std::string_view format) const {
    return by_format_.count(std::string(format)) > 0;
}

bool is_textual_content_type(std::string_view content_type) noexcept {
    auto type = strip_params(content_type);
    return type.starts_with("text/") || type == "application/json" ||
           type == "application/xml" || type == "application/javascript";
}

} // namespace conduit
