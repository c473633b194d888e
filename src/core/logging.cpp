#include "conduit/core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>

#include <nlohmann/json.hpp>

namespace conduit {

namespace {

struct LevelInfo {
    LogLevel level;
    std::string_view name;
    std::string_view color;
};

constexpr std::array<LevelInfo, 7> kLevels{{
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info, "INFO", "\033[32m"},
    {LogLevel::Warn, "WARN", "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35m"},
    {LogLevel::Off, "OFF", ""},
}};

const LevelInfo& info_for(LogLevel level) {
    return kLevels[static_cast<size_t>(level)];
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

// gmt=false: "HH:MM:SS.mmm" local time, gmt=true: ISO-8601 UTC
std::string format_time(std::chrono::system_clock::time_point tp, bool gmt) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm tm{};
    if (gmt) {
        gmtime_r(&seconds, &tm);
    } else {
        localtime_r(&seconds, &tm);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, gmt ? "%Y-%m-%dT%H:%M:%S" : "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    if (gmt) oss << 'Z';
    return oss.str();
}

// Quotes values that would break key=value splitting
void append_field(std::string& out, const std::string& key, const std::string& value) {
    out += ' ';
    out += key;
    out += '=';
    if (value.empty() || value.find_first_of(" \t\"") != std::string::npos) {
        out += nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        out += value;
    }
}

} // anonymous namespace

std::string_view log_level_name(LogLevel level) noexcept {
    return info_for(level).name;
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (iequals(name, "warning")) return LogLevel::Warn;
    for (const auto& info : kLevels) {
        if (iequals(name, info.name)) return info.level;
    }
    return LogLevel::Info;
}

std::string_view LogEntry::get(std::string_view key) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [key](const auto& f) { return f.first == key; });
    return it == fields.end() ? std::string_view{} : std::string_view(it->second);
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogEntry& entry) {
    const auto& info = info_for(entry.level);

    std::string line = format_time(entry.timestamp, false);
    line += ' ';
    if (colored_) line += info.color;
    line += info.name;
    if (colored_) line += "\033[0m";
    line.append(6 - info.name.size(), ' ');
    if (!entry.logger_name.empty()) {
        line += '[' + entry.logger_name + "] ";
    }
    line += entry.message;
    for (const auto& [key, value] : entry.fields) {
        append_field(line, key, value);
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line;
}

void JsonSink::write(const LogEntry& entry) {
    nlohmann::json line = {
        {"timestamp", format_time(entry.timestamp, true)},
        {"level", std::string(log_level_name(entry.level))},
        {"message", entry.message},
    };
    if (!entry.logger_name.empty()) {
        line["logger"] = entry.logger_name;
    }
    for (const auto& [key, value] : entry.fields) {
        line[key] = value;
    }

    // Request paths are not guaranteed to be valid UTF-8
    auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << '\n';
}

void JsonSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool MemorySink::contains(std::string_view text) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [text](const LogEntry& e) {
        return e.message.find(text) != std::string::npos;
    });
}

std::optional<LogEntry> MemorySink::find(std::string_view prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (std::string_view(e.message).substr(0, prefix.size()) == prefix) {
            return e;
        }
    }
    return std::nullopt;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase(sinks_, sink);
    return *this;
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.logger_name = name_;
    e.message = std::move(message);
    return e;
}

void Logger::log(LogLevel level, std::string message) const {
    if (is_enabled(level)) {
        log(entry(level, std::move(message)));
    }
}

void Logger::log(const LogEntry& entry) const {
    if (!is_enabled(entry.level)) return;

    // Sinks lock themselves; writing outside mutex_ lets a sink log
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->write(entry);
    }
}

Logger& default_logger() {
    static Logger logger("conduit");
    static std::once_flag once;
    std::call_once(once, [] { logger.add_sink(std::make_shared<ConsoleSink>()); });
    return logger;
}

} // namespace conduit
