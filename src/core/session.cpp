#include "conduit/core/session.hpp"
#include "conduit/core/logging.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace conduit {

// ============================================================================
// Session Implementation
// ============================================================================

Session::Session(std::string id, bool is_new)
    : id_(std::move(id))
    , is_new_(is_new)
{}

Session Session::deserialize(std::string id, std::string_view serialized) {
    Session session(std::move(id));
    auto parsed = nlohmann::json::parse(serialized, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        log_warn("discarding unreadable session data for " + session.id_);
        session.modified_ = true;
        return session;
    }
    session.data_ = std::move(parsed);
    return session;
}

std::string Session::serialize() const {
    return data_.dump();
}

const nlohmann::json* Session::find(const std::string& key) const {
    auto it = data_.find(key);
    return it == data_.end() ? nullptr : &*it;
}

void Session::remove(const std::string& key) {
    if (data_.erase(key) > 0) {
        modified_ = true;
    }
}

bool Session::has(const std::string& key) const {
    return data_.contains(key);
}

void Session::clear() {
    if (!data_.empty()) {
        data_ = nlohmann::json::object();
        modified_ = true;
    }
}

std::vector<std::string> Session::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [key, _] : data_.items()) {
        result.push_back(key);
    }
    return result;
}

void Session::drop() {
    data_ = nlohmann::json::object();
    dropped_ = true;
    modified_ = false;
}

// ============================================================================
// MemorySessionStore Implementation
// ============================================================================

std::optional<std::string> MemorySessionStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    if (it->second.expires < std::chrono::steady_clock::now()) {
        sessions_.erase(it);
        return std::nullopt;
    }
    return it->second.data;
}

void MemorySessionStore::save(const std::string& id, const std::string& serialized) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& stored = sessions_[id];
    stored.data = serialized;
    stored.expires = std::chrono::steady_clock::now() + max_age_;
}

void MemorySessionStore::destroy(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(id);
}

namespace {

std::string random_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << dis(gen)
        << std::setw(16) << dis(gen);
    return oss.str();
}

} // anonymous namespace

// 128 random bits; regenerated on the (unlikely) clash with a live session
std::string MemorySessionStore::generate_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = random_id();
    while (sessions_.count(id) > 0) {
        id = random_id();
    }
    return id;
}

size_t MemorySessionStore::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    return std::erase_if(sessions_, [now](const auto& entry) { return entry.second.expires < now; });
}

size_t MemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ============================================================================
// Session Options
// ============================================================================

Cookie SessionOptions::make_cookie(const std::string& session_id) const {
    Cookie cookie{cookie_name, session_id};
    cookie.path = cookie_path;
    if (!cookie_domain.empty()) cookie.domain = cookie_domain;
    cookie.max_age = max_age;
    cookie.secure = secure;
    cookie.http_only = http_only;
    cookie.same_site = same_site;
    return cookie;
}

} // namespace conduit
