#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace conduit {

// ============================================================================
// TemplateKey - (view namespace, template name, format)
// ============================================================================

struct TemplateKey {
    std::string view;   // "page", empty for top-level templates such as layouts
    std::string name;   // "index", "layouts/app"
    std::string format; // "html"

    /// Relative path of the template resource: "page/index.html".
    std::string path() const {
        std::string p;
        if (!view.empty()) {
            p += view;
            p += '/';
        }
        p += name;
        p += '.';
        p += format;
        return p;
    }

    bool operator==(const TemplateKey&) const = default;
};

// ============================================================================
// TemplateEngine - resolves and renders template resources
// ============================================================================

/// The templating language lives behind this interface. Implementations are
/// shared by every request and must be safe to call concurrently.
struct TemplateEngine {
    virtual ~TemplateEngine() = default;

    virtual bool exists(const TemplateKey& key) const = 0;

    /// Rendered body, or nullopt when no template matches key.
    /// Failures inside a matching template raise TemplateRenderFailed.
    virtual std::optional<std::string>
    render(const TemplateKey& key, const nlohmann::json& assigns) const = 0;
};

} // namespace conduit
