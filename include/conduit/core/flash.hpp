#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace conduit {

// ============================================================================
// FlashStore
// ============================================================================

/// Keyed user-facing messages for the current request.
///
/// Messages live for the request that wrote them. persist(key) snapshots the
/// key's current messages into the session so that exactly one following
/// request sees them again, read or not. A key without messages is the same
/// as an absent key: lookups never fail.
///
/// Operations mutate the store in place.
class FlashStore {
public:
    using Messages = std::vector<std::string>;

    // Session key holding the persisted snapshot
    static constexpr std::string_view session_key = "_flash";

private:
    std::map<std::string, Messages, std::less<>> messages_;
    std::map<std::string, Messages, std::less<>> persisted_;

public:
    FlashStore() = default;

    // Appends message to key's sequence
    void put(std::string key, std::string message);

    // First message for key, nullopt when key has none
    std::optional<std::string> get(std::string_view key) const;

    // All messages for key in insertion order, empty when key has none
    Messages get_all(std::string_view key) const;

    // All messages for key; the key (and its persisted snapshot) is removed
    Messages pop_all(std::string_view key);

    // Snapshot key's current messages for the next request. No-op for an
    // empty key; persisting again replaces the snapshot.
    void persist(std::string_view key);
    void persist_all();
    bool is_persisted(std::string_view key) const;

    // Removes every key, persisted or not
    void clear();

    bool empty() const noexcept { return messages_.empty(); }
    size_t size() const noexcept { return messages_.size(); }
    std::vector<std::string> keys() const;

    // {"info": ["..."], ...} of the current messages, for templates
    nlohmann::json to_json() const;

    // Persisted snapshot in session form; an empty object when nothing is persisted
    nlohmann::json serialize() const;

    // Messages carried over from the previous request. They are readable now
    // and dropped at the end of this request unless persisted again.
    static FlashStore hydrate(const nlohmann::json& stored);
};

// ============================================================================
// Flash Options
// ============================================================================

struct FlashOptions {
    // Persist every current key when the response is a 3xx redirect
    bool persist_on_redirect = false;
};

} // namespace conduit
