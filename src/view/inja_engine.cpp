#include "conduit/view/inja_engine.hpp"

#include "conduit/core/error.hpp"

#include <optional>
#include <sstream>
#include <stdexcept>

namespace conduit {

// Hands a Slot to one render call and parks it again afterwards
class InjaTemplateEngine::Lease {
    const InjaTemplateEngine& engine_;
    std::unique_ptr<Slot> slot_;

public:
    Lease(const InjaTemplateEngine& engine, std::unique_ptr<Slot> slot)
        : engine_(engine), slot_(std::move(slot)) {}

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    ~Lease() {
        std::lock_guard lock(engine_.mutex_);
        // A stale environment is dropped rather than parked
        if (slot_->generation == engine_.generation_) {
            engine_.idle_.push_back(std::move(slot_));
        }
    }

    Slot& operator*() const noexcept { return *slot_; }
    Slot* operator->() const noexcept { return slot_.get(); }
};

InjaTemplateEngine::InjaTemplateEngine(std::filesystem::path root, bool caching)
    : root_(std::move(root)), caching_(caching) {}

InjaTemplateEngine::~InjaTemplateEngine() = default;

// Caller holds mutex_
std::unique_ptr<InjaTemplateEngine::Slot> InjaTemplateEngine::make_slot() const {
    auto slot = std::make_unique<Slot>();
    // Trailing separator makes includes resolve relative to root
    slot->env = std::make_unique<inja::Environment>((root_ / "").string());
    slot->env->set_search_included_templates_in_files(true);
    for (const auto& cb : callbacks_) {
        slot->env->add_callback(cb.name, cb.num_args, cb.fn);
    }
    slot->generation = generation_;
    return slot;
}

InjaTemplateEngine& InjaTemplateEngine::add_template(std::string path, std::string source) {
    std::lock_guard lock(mutex_);
    sources_[std::move(path)] = std::move(source);
    ++generation_;
    idle_.clear();
    return *this;
}

InjaTemplateEngine& InjaTemplateEngine::add_callback(const std::string& name, int num_args,
                                                     const Callback& callback) {
    std::lock_guard lock(mutex_);
    callbacks_.push_back({name, num_args, callback});
    ++generation_;
    idle_.clear();
    return *this;
}

bool InjaTemplateEngine::exists(const TemplateKey& key) const {
    auto path = key.path();
    {
        std::lock_guard lock(mutex_);
        if (sources_.count(path) > 0) {
            return true;
        }
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(root_ / path, ec);
}

std::optional<std::string> InjaTemplateEngine::render(const TemplateKey& key,
                                                      const nlohmann::json& assigns) const {
    auto path = key.path();

    std::optional<std::string> source;
    std::unique_ptr<Slot> slot;
    {
        std::lock_guard lock(mutex_);
        if (auto it = sources_.find(path); it != sources_.end()) {
            source = it->second;
        }
        if (idle_.empty()) {
            slot = make_slot();
        } else {
            slot = std::move(idle_.back());
            idle_.pop_back();
        }
    }
    Lease lease(*this, std::move(slot));

    try {
        if (auto it = lease->cache.find(path); it != lease->cache.end()) {
            return lease->env->render(it->second, assigns);
        }

        std::optional<inja::Template> tmpl;
        if (source) {
            tmpl.emplace(lease->env->parse(*source));
        } else {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(root_ / path, ec)) {
                return std::nullopt;
            }
            tmpl.emplace(lease->env->parse_template(path));
        }

        std::string result = lease->env->render(*tmpl, assigns);
        if (caching_) {
            lease->cache.emplace(path, std::move(*tmpl));
        }
        return result;
    } catch (const inja::InjaError& e) {
        throw ConduitError(ErrorCode::TemplateRenderFailed, path + ": " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConduitError(ErrorCode::TemplateRenderFailed, path + ": " + e.what());
    }
}

void InjaTemplateEngine::validate(const std::vector<TemplateKey>& keys) const {
    std::vector<std::string> missing;
    for (const auto& key : keys) {
        if (!exists(key)) {
            missing.push_back(key.path() + " (resolved: " + (root_ / key.path()).string() + ")");
        }
    }

    if (!missing.empty()) {
        std::ostringstream oss;
        oss << "Template validation failed. Missing templates:\n";
        for (const auto& m : missing) {
            oss << "  - " << m << "\n";
        }
        oss << "Template directory: " << root_.string();
        throw std::runtime_error(oss.str());
    }
}

void InjaTemplateEngine::clear_cache() {
    std::lock_guard lock(mutex_);
    ++generation_;
    idle_.clear();
}

size_t InjaTemplateEngine::idle_environments() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

} // namespace conduit
