#pragma once
// =============================================================================
// Guard Preconditions - Logging (C++20)
// Version: 1.0.0
// Named loggers writing records to shared sinks
// =============================================================================

#include "guard/common/types.hpp"
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace guard::logging {

// DEBUG and ERROR collide with common platform macros.
enum class LogLevel : UInt8 {
    TRACE = 0,
    DBG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

[[nodiscard]] StringView to_string(LogLevel level) noexcept;

// Case-insensitive; accepts "debug"/"dbg", "warn"/"warning", "error"/"err".
[[nodiscard]] Optional<LogLevel> parse_level(StringView name);

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    String logger;
    String message;
    SystemTimePoint time = SystemClock::now();

    // "2024-05-01 10:00:00.123 [ WARN] [guard.precondition] message"
    [[nodiscard]] String format(bool colored = false) const;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

// ERROR and FATAL go to stderr, everything else to stdout.
class ConsoleSink : public LogSink {
private:
    bool colored_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool colored = true) : colored_(colored) {}

    void write(const LogRecord& record) override;
    void flush() override;
};

class Logger {
private:
    String name_;
    std::atomic<LogLevel> level_;
    Vector<SharedPtr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;

    void emit(LogLevel level, String message);

public:
    explicit Logger(String name, LogLevel level = LogLevel::INFO);

    [[nodiscard]] const String& name() const noexcept { return name_; }
    [[nodiscard]] LogLevel level() const noexcept { return level_.load(); }
    void set_level(LogLevel level) noexcept { level_.store(level); }
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level != LogLevel::OFF && level >= level_.load();
    }

    void add_sink(SharedPtr<LogSink> sink);
    void set_sinks(Vector<SharedPtr<LogSink>> sinks);
    void flush();

    template<typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level)) emit(level, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::DBG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
    }
};

// Process-wide registry. Every logger shares the manager's level and sinks;
// changing either updates loggers already handed out. The first call to
// instance() applies the GUARD_LOG_* environment settings.
class LogManager {
private:
    std::unordered_map<String, SharedPtr<Logger>> loggers_;
    Vector<SharedPtr<LogSink>> sinks_;
    LogLevel level_ = LogLevel::INFO;
    mutable std::mutex mutex_;

    LogManager();

public:
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    static LogManager& instance();

    [[nodiscard]] SharedPtr<Logger> get_logger(const String& name);
    [[nodiscard]] LogLevel level() const;

    void set_level(LogLevel level);
    void add_sink(SharedPtr<LogSink> sink);
    // Drops every sink and installs a console sink.
    void reset(LogLevel level, bool colored = true);
    void flush();
};

} // namespace guard::logging
