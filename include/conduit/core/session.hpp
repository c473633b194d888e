#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "conduit/core/cookie.hpp"

namespace conduit {

// ============================================================================
// Session Data
// ============================================================================

/// Per-request view of the client's session. Values are JSON so the whole
/// session round-trips through SessionStore as one serialized string.
class Session {
    std::string id_;
    nlohmann::json data_ = nlohmann::json::object();
    bool modified_ = false;
    bool is_new_ = false;
    bool dropped_ = false;

public:
    Session() = default;
    explicit Session(std::string id, bool is_new = false);

    // Rebuilds a session from SessionStore::load(). Data that is not a JSON
    // object yields an empty session that will overwrite it on save.
    static Session deserialize(std::string id, std::string_view serialized);
    std::string serialize() const;

    const std::string& id() const { return id_; }
    bool is_new() const { return is_new_; }
    bool is_modified() const { return modified_; }

    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        try {
            return it->get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    template<typename T>
    T get_or(const std::string& key, T default_value) const {
        return get<T>(key).value_or(std::move(default_value));
    }

    // Raw JSON value, nullptr if absent
    const nlohmann::json* find(const std::string& key) const;

    template<typename T>
    void set(const std::string& key, T value) {
        data_[key] = std::move(value);
        modified_ = true;
    }

    void remove(const std::string& key);
    bool has(const std::string& key) const;
    void clear();
    std::vector<std::string> keys() const;
    bool empty() const { return data_.empty(); }

    const nlohmann::json& data() const { return data_; }

    // Drop the session: the store entry is destroyed and the cookie expired
    // when the response is sent.
    void drop();
    bool is_dropped() const { return dropped_; }

    void mark_saved() { modified_ = false; }
};

// ============================================================================
// Session Store Interface
// ============================================================================

class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Serialized session data, nullopt if unknown or expired
    virtual std::optional<std::string> load(const std::string& id) = 0;

    virtual void save(const std::string& id, const std::string& serialized) = 0;

    virtual void destroy(const std::string& id) = 0;

    virtual std::string generate_id() = 0;
};

// ============================================================================
// In-Memory Session Store
// ============================================================================

class MemorySessionStore : public SessionStore {
    struct StoredSession {
        std::string data;
        std::chrono::steady_clock::time_point expires;
    };

    std::unordered_map<std::string, StoredSession> sessions_;
    mutable std::mutex mutex_;
    std::chrono::seconds max_age_{3600};

public:
    MemorySessionStore() = default;
    explicit MemorySessionStore(std::chrono::seconds max_age) : max_age_(max_age) {}

    std::optional<std::string> load(const std::string& id) override;
    void save(const std::string& id, const std::string& serialized) override;
    void destroy(const std::string& id) override;
    std::string generate_id() override;

    // Remove expired entries; returns how many were removed
    size_t cleanup();

    size_t size() const;
};

// ============================================================================
// Session Options
// ============================================================================

struct SessionOptions {
    std::string cookie_name = "_conduit_key";
    std::string cookie_path = "/";
    std::string cookie_domain;

    std::chrono::seconds max_age{3600};

    bool secure = false;
    bool http_only = true;
    SameSite same_site = SameSite::Lax;

    Cookie make_cookie(const std::string& session_id) const;
};

} // namespace conduit
