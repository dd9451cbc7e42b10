#pragma once

#include "types.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tessera {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Debug,      // Per-icon timing
    Info,       // Job start and finish, written files, empty sets
    Warn,       // Fallback rasters, truncated sets
    Error,      // Failed jobs, rejected categories
    Off
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

struct LogRecord {
    LogLevel level;
    std::string_view logger_name;
    std::string_view message;
    std::chrono::system_clock::time_point timestamp;
};

// "2024-05-01 12:00:00.123 warn  [atlas] message"
[[nodiscard]] std::string format_log_line(const LogRecord& record);

// ============================================================================
// Sinks
//
// Sinks are called with the logging lock held, one record at a time, so
// implementations need no synchronization of their own.
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Everything goes to stderr; stdout is left to the tool's own output
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true) : m_use_colors(use_colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends plain lines to a file
class FileSink : public LogSink {
public:
    explicit FileSink(const char* filename);

    [[nodiscard]] bool is_open() const noexcept { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    struct Closer {
        void operator()(std::FILE* file) const { std::fclose(file); }
    };
    std::unique_ptr<std::FILE, Closer> m_file;
};

// Keeps records for inspection
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string logger_name;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] std::vector<Entry> entries() const;
    [[nodiscard]] usize count(LogLevel level) const;
    void clear();

private:
    std::vector<Entry> m_entries;
};

// ============================================================================
// Logger - named front end; filtering uses the global level
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warn(std::string_view message) { log(LogLevel::Warn, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }

    // Arguments are only formatted when the level is enabled
    template<typename... Args>
    void log_fmt(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (is_enabled(level)) {
            log(level, fmt::vformat(format, fmt::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void debug_fmt(fmt::format_string<Args...> format, Args&&... args) {
        log_fmt(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(fmt::format_string<Args...> format, Args&&... args) {
        log_fmt(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(fmt::format_string<Args...> format, Args&&... args) {
        log_fmt(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(fmt::format_string<Args...> format, Args&&... args) {
        log_fmt(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    [[nodiscard]] std::string_view name() const { return m_name; }
    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    std::string m_name;
};

// ============================================================================
// Global logging state
// ============================================================================

namespace logging {

// Installs a ConsoleSink when no sink was added yet
void init();

// Flushes and drops every sink
void shutdown();

// Returns a non-owning pointer for remove_sink
LogSink* add_sink(std::unique_ptr<LogSink> sink);
void remove_sink(LogSink* sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Loggers live until process exit; references stay valid
[[nodiscard]] Logger& get(std::string_view name);
[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

#define TESSERA_LOG_DEBUG(msg) ::tessera::logging::default_logger().debug(msg)
#define TESSERA_LOG_INFO(msg)  ::tessera::logging::default_logger().info(msg)
#define TESSERA_LOG_WARN(msg)  ::tessera::logging::default_logger().warn(msg)
#define TESSERA_LOG_ERROR(msg) ::tessera::logging::default_logger().error(msg)

#define TESSERA_LOG_DEBUG_FMT(fmt, ...) ::tessera::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define TESSERA_LOG_INFO_FMT(fmt, ...)  ::tessera::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define TESSERA_LOG_WARN_FMT(fmt, ...)  ::tessera::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define TESSERA_LOG_ERROR_FMT(fmt, ...) ::tessera::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)

} // namespace tessera
