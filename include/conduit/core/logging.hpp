#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace conduit {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal, Off };

std::string_view log_level_name(LogLevel level) noexcept;

// Case-insensitive; "warning" is accepted for Warn. Unknown names give Info.
LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LogEntry - one message plus key=value fields
// ============================================================================

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string logger_name;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;

    template<typename T>
    LogEntry& field(std::string key, const T& value) {
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            fields.emplace_back(std::move(key), std::string(std::string_view(value)));
        } else {
            std::ostringstream oss;
            oss << value;
            fields.emplace_back(std::move(key), oss.str());
        }
        return *this;
    }

    // Value of the first field named key, empty if absent
    std::string_view get(std::string_view key) const;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

/// Human readable lines on stderr:
///   12:00:01.042 INFO  [conduit] GET /posts - Sent 200 in 3ms status=200
class ConsoleSink : public LogSink {
    bool colored_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool colored = true) : colored_(colored) {}
    void write(const LogEntry& entry) override;
};

/// One JSON object per line, fields flattened next to "message".
class JsonSink : public LogSink {
    std::ostream& out_;
    std::mutex mutex_;

public:
    explicit JsonSink(std::ostream& out = std::cout) : out_(out) {}
    void write(const LogEntry& entry) override;
    void flush() override;
};

/// Keeps every entry; tests assert against it.
class MemorySink : public LogSink {
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;

public:
    void write(const LogEntry& entry) override;

    std::vector<LogEntry> entries() const;

    // Substring match on the message
    bool contains(std::string_view text) const;

    // First entry whose message starts with prefix
    std::optional<LogEntry> find(std::string_view prefix) const;

    void clear();
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
    std::string name_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    explicit Logger(std::string name = {}) : name_(std::move(name)) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Logger& set_level(LogLevel level) {
        level_.store(level, std::memory_order_relaxed);
        return *this;
    }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    bool is_enabled(LogLevel level) const { return level >= this->level() && level != LogLevel::Off; }

    Logger& add_sink(std::shared_ptr<LogSink> sink);
    Logger& remove_sink(const std::shared_ptr<LogSink>& sink);

    const std::string& name() const { return name_; }

    // Stamped entry ready for field() calls
    LogEntry entry(LogLevel level, std::string message) const;

    void log(const LogEntry& entry) const;
    void log(LogLevel level, std::string message) const;

    void trace(std::string message) const { log(LogLevel::Trace, std::move(message)); }
    void debug(std::string message) const { log(LogLevel::Debug, std::move(message)); }
    void info(std::string message) const { log(LogLevel::Info, std::move(message)); }
    void warn(std::string message) const { log(LogLevel::Warn, std::move(message)); }
    void error(std::string message) const { log(LogLevel::Error, std::move(message)); }
};

// ============================================================================
// Process-wide logger
// ============================================================================

// Named "conduit", writes to a ConsoleSink until reconfigured
Logger& default_logger();

inline void log_debug(std::string msg) { default_logger().debug(std::move(msg)); }
inline void log_info(std::string msg) { default_logger().info(std::move(msg)); }
inline void log_warn(std::string msg) { default_logger().warn(std::move(msg)); }
inline void log_error(std::string msg) { default_logger().error(std::move(msg)); }

} // namespace conduit
