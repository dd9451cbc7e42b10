/**
 * Logging sinks and global logger registry
 */

#include "tessera/core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <map>
#include <mutex>

namespace tessera {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::map<std::string, std::unique_ptr<Logger>, std::less<>> loggers;
    std::atomic<LogLevel> level{LogLevel::Info};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// Caller holds the state mutex
void ensure_console_locked(LoggingState& s) {
    if (s.sinks.empty()) {
        s.sinks.push_back(std::make_unique<ConsoleSink>());
    }
}

Logger& get_locked(LoggingState& s, std::string_view name) {
    auto it = s.loggers.find(name);
    if (it == s.loggers.end()) {
        it = s.loggers.emplace(std::string(name), std::make_unique<Logger>(name)).first;
    }
    return *it->second;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}", buffer, static_cast<int>(ms.count()));
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // anonymous namespace

std::string format_log_line(const LogRecord& record) {
    if (record.logger_name.empty()) {
        return fmt::format("{} {:<5} {}", format_timestamp(record.timestamp),
                           log_level_name(record.level), record.message);
    }
    return fmt::format("{} {:<5} [{}] {}", format_timestamp(record.timestamp),
                       log_level_name(record.level), record.logger_name, record.message);
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    std::string line = format_log_line(record);
    if (m_use_colors) {
        fmt::print(stderr, "{}{}\033[0m\n", level_color(record.level), line);
    } else {
        fmt::print(stderr, "{}\n", line);
    }
}

void ConsoleSink::flush() {
    std::fflush(stderr);
}

FileSink::FileSink(const char* filename) : m_file(std::fopen(filename, "a")) {}

void FileSink::write(const LogRecord& record) {
    if (m_file) {
        fmt::print(m_file.get(), "{}\n", format_log_line(record));
    }
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file.get());
    }
}

void MemorySink::write(const LogRecord& record) {
    m_entries.push_back({record.level, std::string(record.logger_name), std::string(record.message)});
}

std::vector<MemorySink::Entry> MemorySink::entries() const {
    std::lock_guard lock(state().mutex);
    return m_entries;
}

usize MemorySink::count(LogLevel level) const {
    std::lock_guard lock(state().mutex);
    return static_cast<usize>(std::count_if(m_entries.begin(), m_entries.end(),
        [level](const Entry& entry) { return entry.level == level; }));
}

void MemorySink::clear() {
    std::lock_guard lock(state().mutex);
    m_entries.clear();
}

// ============================================================================
// Logger
// ============================================================================

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= state().level.load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!is_enabled(level)) {
        return;
    }

    auto& s = state();
    std::lock_guard lock(s.mutex);
    ensure_console_locked(s);

    const LogRecord record{level, m_name, message, std::chrono::system_clock::now()};
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global state
// ============================================================================

namespace logging {

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    ensure_console_locked(s);
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
}

LogSink* add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    ensure_console_locked(s);
    LogSink* raw = sink.get();
    s.sinks.push_back(std::move(sink));
    return raw;
}

void remove_sink(LogSink* sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    std::erase_if(s.sinks, [sink](const std::unique_ptr<LogSink>& owned) {
        return owned.get() == sink;
    });
}

void set_level(LogLevel level) {
    state().level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return state().level.load(std::memory_order_relaxed);
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return get_locked(s, name);
}

Logger& default_logger() {
    return get("tessera");
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

} // namespace logging

} // namespace tessera
