#include "conduit/core/request.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace conduit {

namespace {

constexpr std::array<std::pair<HttpMethod, std::string_view>, 9> kMethods{{
    {HttpMethod::GET, "GET"},
    {HttpMethod::POST, "POST"},
    {HttpMethod::PUT, "PUT"},
    {HttpMethod::DELETE, "DELETE"},
    {HttpMethod::PATCH, "PATCH"},
    {HttpMethod::HEAD, "HEAD"},
    {HttpMethod::OPTIONS, "OPTIONS"},
    {HttpMethod::CONNECT, "CONNECT"},
    {HttpMethod::TRACE, "TRACE"},
}};

} // anonymous namespace

// Method names are case-sensitive
HttpMethod parse_method(std::string_view method) noexcept {
    for (const auto& [value, name] : kMethods) {
        if (name == method) return value;
    }
    return HttpMethod::UNKNOWN;
}

std::string_view method_to_string(HttpMethod method) noexcept {
    for (const auto& [value, name] : kMethods) {
        if (value == method) return name;
    }
    return "UNKNOWN";
}

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

std::string url_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < input.size()) {
            int hi = hex_digit(input[i + 1]);
            int lo = hex_digit(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                // Malformed escape is kept literally
                result += c;
            }
        } else {
            result += c;
        }
    }

    return result;
}

Request::Params Request::parse_query(std::string_view query) {
    Params params;

    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }

        auto pair = query.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value =
                eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
            if (!key.empty()) {
                // Last occurrence wins
                params[std::move(key)] = std::move(value);
            }
        }

        start = end + 1;
    }

    return params;
}

Request& Request::set_query_string(std::string qs) {
    query_params_ = parse_query(qs);
    query_string_ = std::move(qs);
    return *this;
}

Request& Request::add_header(std::string_view key, std::string value) {
    headers_[to_lower(key)] = std::move(value);
    return *this;
}

Request& Request::add_query_param(std::string key, std::string value) {
    query_params_[std::move(key)] = std::move(value);
    return *this;
}

Request& Request::add_body_param(std::string key, std::string value) {
    body_params_[std::move(key)] = std::move(value);
    return *this;
}

Request& Request::add_path_param(std::string key, std::string value) {
    path_params_[std::move(key)] = std::move(value);
    return *this;
}

std::optional<std::string_view> Request::header(std::string_view key) const {
    auto it = headers_.find(to_lower(key));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace conduit
