#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "conduit/core/logging.hpp"

namespace conduit {

// ============================================================================
// Endpoint Configuration
// ============================================================================

struct EndpointConfig {
    // Templates
    std::filesystem::path template_dir = "templates";
    bool template_caching = true;

    // Layout for controllers created without explicit options
    std::optional<std::string> default_layout;

    // Formats accepted by controllers that declare none
    std::vector<std::string> accepted_formats;

    // Session cookie
    std::string session_cookie = "_conduit_key";

    LogLevel log_level = LogLevel::Info;

    // Keys: template_dir, template_caching, default_layout, accepted_formats,
    // session_cookie, log_level. Unknown keys are ignored.
    static EndpointConfig from_json(const nlohmann::json& json);

    // Throws std::runtime_error naming path when it cannot be read or parsed
    static EndpointConfig from_file(const std::filesystem::path& path);

    // CONDUIT_TEMPLATE_DIR, CONDUIT_LOG_LEVEL, CONDUIT_SESSION_COOKIE over base
    static EndpointConfig from_env(EndpointConfig base);
    static EndpointConfig from_env();
};

inline EndpointConfig EndpointConfig::from_env() { return from_env(EndpointConfig{}); }

} // namespace conduit
