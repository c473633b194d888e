#include "conduit/core/response.hpp"
#include "conduit/core/status.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace conduit {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

std::string_view Response::status_text() const noexcept {
    return reason_phrase(status_);
}

std::optional<std::string_view> Response::header(std::string_view key) const {
    for (const auto& [k, v] : headers_) {
        if (iequals(k, key)) return v;
    }
    return std::nullopt;
}

std::vector<std::string_view> Response::header_values(std::string_view key) const {
    std::vector<std::string_view> values;
    for (const auto& [k, v] : headers_) {
        if (iequals(k, key)) values.push_back(v);
    }
    return values;
}

std::string Response::serialize() const {
    std::ostringstream oss;

    // Status line
    oss << "HTTP/1.1 " << status_ << " " << status_text() << "\r\n";

    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << "\r\n";
    }

    // Empty line separating headers from body
    oss << "\r\n";

    oss << body_;

    return oss.str();
}

Response Response::plain(int status, std::string body) {
    Headers headers;
    headers.emplace_back("content-type", "text/plain; charset=utf-8");
    headers.emplace_back("content-length", std::to_string(body.size()));
    return Response(status, std::move(headers), std::move(body));
}

} // namespace conduit
