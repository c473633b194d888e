#include "conduit/core/flash.hpp"

namespace conduit {

void FlashStore::put(std::string key, std::string message) {
    messages_[std::move(key)].push_back(std::move(message));
}

std::optional<std::string> FlashStore::get(std::string_view key) const {
    auto it = messages_.find(key);
    if (it == messages_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

FlashStore::Messages FlashStore::get_all(std::string_view key) const {
    auto it = messages_.find(key);
    if (it == messages_.end()) {
        return {};
    }
    return it->second;
}

FlashStore::Messages FlashStore::pop_all(std::string_view key) {
    Messages result;
    auto it = messages_.find(key);
    if (it != messages_.end()) {
        result = std::move(it->second);
        messages_.erase(it);
    }
    if (auto p = persisted_.find(key); p != persisted_.end()) {
        persisted_.erase(p);
    }
    return result;
}

void FlashStore::persist(std::string_view key) {
    auto it = messages_.find(key);
    if (it == messages_.end() || it->second.empty()) {
        return;
    }
    persisted_[it->first] = it->second;
}

void FlashStore::persist_all() {
    for (const auto& [key, messages] : messages_) {
        persisted_[key] = messages;
    }
}

bool FlashStore::is_persisted(std::string_view key) const {
    return persisted_.find(key) != persisted_.end();
}

void FlashStore::clear() {
    messages_.clear();
    persisted_.clear();
}

std::vector<std::string> FlashStore::keys() const {
    std::vector<std::string> result;
    result.reserve(messages_.size());
    for (const auto& [key, _] : messages_) {
        result.push_back(key);
    }
    return result;
}

nlohmann::json FlashStore::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, messages] : messages_) {
        out[key] = messages;
    }
    return out;
}

nlohmann::json FlashStore::serialize() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, messages] : persisted_) {
        out[key] = messages;
    }
    return out;
}

FlashStore FlashStore::hydrate(const nlohmann::json& stored) {
    FlashStore store;
    if (!stored.is_object()) {
        return store;
    }
    for (const auto& [key, value] : stored.items()) {
        if (value.is_string()) {
            store.put(key, value.get<std::string>());
            continue;
        }
        if (!value.is_array()) {
            continue;
        }
        for (const auto& message : value) {
            if (message.is_string()) {
                store.put(key, message.get<std::string>());
            }
        }
    }
    return store;
}

} // namespace conduit
