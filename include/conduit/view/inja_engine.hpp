#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>

#include "conduit/view/template_engine.hpp"

namespace conduit {

// ============================================================================
// InjaTemplateEngine - Jinja2-style templates via inja
// ============================================================================

/// Templates resolve to "<root>/<view>/<name>.<format>". Templates added with
/// add_template() take precedence over files, which lets tests and embedded
/// deployments run without a template directory.
///
/// inja::Environment is not safe for concurrent use, so each render leases an
/// environment (with its own parsed-template cache) from a pool and renders
/// without holding the engine lock. Callbacks may render through the same
/// engine.
class InjaTemplateEngine : public TemplateEngine {
public:
    using Callback = std::function<nlohmann::json(inja::Arguments&)>;

private:
    struct CallbackEntry {
        std::string name;
        int num_args;
        Callback fn;
    };

    struct Slot {
        std::unique_ptr<inja::Environment> env;
        std::unordered_map<std::string, inja::Template> cache;
        std::uint64_t generation = 0;
    };

    class Lease;

    std::filesystem::path root_;
    bool caching_ = true;

    // Guarded by mutex_. generation_ moves on every change that invalidates
    // an environment: new sources, new callbacks, clear_cache().
    std::unordered_map<std::string, std::string> sources_;
    std::vector<CallbackEntry> callbacks_;
    std::uint64_t generation_ = 0;
    mutable std::vector<std::unique_ptr<Slot>> idle_;
    mutable std::mutex mutex_;

    std::unique_ptr<Slot> make_slot() const;

public:
    explicit InjaTemplateEngine(std::filesystem::path root = "templates", bool caching = true);
    ~InjaTemplateEngine() override;

    const std::filesystem::path& root() const noexcept { return root_; }
    bool caching() const noexcept { return caching_; }

    // Registers an in-memory template under its relative path ("page/index.html")
    InjaTemplateEngine& add_template(std::string path, std::string source);

    InjaTemplateEngine& add_callback(const std::string& name, int num_args, const Callback& callback);

    bool exists(const TemplateKey& key) const override;

    std::optional<std::string> render(const TemplateKey& key,
                                      const nlohmann::json& assigns) const override;

    // Throws std::runtime_error listing every key without a template
    void validate(const std::vector<TemplateKey>& keys) const;

    void clear_cache();

    // Environments currently parked in the pool
    size_t idle_environments() const;
};

} // namespace conduit
