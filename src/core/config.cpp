#include "conduit/core/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace conduit {

EndpointConfig EndpointConfig::from_json(const nlohmann::json& json) {
    EndpointConfig config;
    if (!json.is_object()) {
        return config;
    }

    if (auto it = json.find("template_dir"); it != json.end() && it->is_string()) {
        config.template_dir = it->get<std::string>();
    }
    if (auto it = json.find("template_caching"); it != json.end() && it->is_boolean()) {
        config.template_caching = it->get<bool>();
    }
    if (auto it = json.find("default_layout"); it != json.end() && it->is_string()) {
        config.default_layout = it->get<std::string>();
    }
    if (auto it = json.find("accepted_formats"); it != json.end() && it->is_array()) {
        for (const auto& format : *it) {
            if (format.is_string()) {
                config.accepted_formats.push_back(format.get<std::string>());
            }
        }
    }
    if (auto it = json.find("session_cookie"); it != json.end() && it->is_string()) {
        config.session_cookie = it->get<std::string>();
    }
    if (auto it = json.find("log_level"); it != json.end() && it->is_string()) {
        config.log_level = parse_log_level(it->get<std::string>());
    }

    return config;
}

EndpointConfig EndpointConfig::from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file " + path.string());
    }

    auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw std::runtime_error("malformed config file " + path.string());
    }
    return from_json(json);
}

EndpointConfig EndpointConfig::from_env(EndpointConfig base) {
    if (const char* dir = std::getenv("CONDUIT_TEMPLATE_DIR")) {
        base.template_dir = dir;
    }
    if (const char* level = std::getenv("CONDUIT_LOG_LEVEL")) {
        base.log_level = parse_log_level(level);
    }
    if (const char* cookie = std::getenv("CONDUIT_SESSION_COOKIE")) {
        base.session_cookie = cookie;
    }
    return base;
}

} // namespace conduit
