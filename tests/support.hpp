#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <conduit/view/template_engine.hpp>

namespace conduit::testing {

// Template engine over a path -> source map. "{{ key }}" placeholders are
// replaced by the string assign of the same name; every lookup is recorded.
class MapTemplateEngine : public TemplateEngine {
    std::map<std::string, std::string> templates_;
    mutable std::vector<std::string> lookups_;
    mutable nlohmann::json last_assigns_;

public:
    MapTemplateEngine& add(std::string path, std::string source) {
        templates_[std::move(path)] = std::move(source);
        return *this;
    }

    bool exists(const TemplateKey& key) const override {
        return templates_.count(key.path()) > 0;
    }

    std::optional<std::string> render(const TemplateKey& key,
                                      const nlohmann::json& assigns) const override {
        lookups_.push_back(key.path());
        last_assigns_ = assigns;
        auto it = templates_.find(key.path());
        if (it == templates_.end()) {
            return std::nullopt;
        }

        std::string out = it->second;
        for (const auto& [name, value] : assigns.items()) {
            if (!value.is_string()) {
                continue;
            }
            std::string placeholder = "{{ " + name + " }}";
            for (auto pos = out.find(placeholder); pos != std::string::npos;
                 pos = out.find(placeholder, pos)) {
                auto replacement = value.get<std::string>();
                out.replace(pos, placeholder.size(), replacement);
                pos += replacement.size();
            }
        }
        return out;
    }

    // Not thread-safe; only used by single-threaded tests
    const std::vector<std::string>& lookups() const { return lookups_; }
    void clear_lookups() { lookups_.clear(); }

    // Assigns passed to the most recent render call
    const nlohmann::json& last_assigns() const { return last_assigns_; }
};

} // namespace conduit::testing
