#include "guard/common/logging.hpp"
#include "guard/common/config.hpp"
#include <iostream>

namespace guard::logging {

StringView to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DBG:   return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

Optional<LogLevel> parse_level(StringView name) {
    const String key = to_upper(trim(name));
    if (key == "TRACE") return LogLevel::TRACE;
    if (key == "DEBUG" || key == "DBG") return LogLevel::DBG;
    if (key == "INFO") return LogLevel::INFO;
    if (key == "WARN" || key == "WARNING") return LogLevel::WARN;
    if (key == "ERROR" || key == "ERR") return LogLevel::ERR;
    if (key == "FATAL") return LogLevel::FATAL;
    if (key == "OFF") return LogLevel::OFF;
    return std::nullopt;
}

// =============================================================================
// LogRecord
// =============================================================================

namespace {

StringView color_of(LogLevel level) {
    switch (level) {
        case LogLevel::DBG:   return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERR:
        case LogLevel::FATAL: return "\033[31m";
        default:              return "\033[90m";
    }
}

constexpr StringView RESET = "\033[0m";

} // anonymous namespace

String LogRecord::format(bool colored) const {
    const auto stamp = std::chrono::floor<Milliseconds>(time);
    const auto tag = std::format("[{:>5}]", to_string(level));
    return std::format("{:%F %T} {}{}{} [{}] {}",
        stamp,
        colored ? color_of(level) : StringView{},
        tag,
        colored ? RESET : StringView{},
        logger, message);
}

// =============================================================================
// ConsoleSink
// =============================================================================

void ConsoleSink::write(const LogRecord& record) {
    std::ostream& out = record.level >= LogLevel::ERR ? std::cerr : std::cout;
    const String line = record.format(colored_);
    std::lock_guard<std::mutex> lock(mutex_);
    out << line << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger(String name, LogLevel level)
    : name_(std::move(name)), level_(level) {}

void Logger::add_sink(SharedPtr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_sinks(Vector<SharedPtr<LogSink>> sinks) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_ = std::move(sinks);
}

void Logger::emit(LogLevel level, String message) {
    LogRecord record;
    record.level = level;
    record.logger = name_;
    record.message = std::move(message);

    Vector<SharedPtr<LogSink>> targets;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        targets = sinks_;
    }
    for (const auto& sink : targets) {
        sink->write(record);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// =============================================================================
// LogManager
// =============================================================================

LogManager::LogManager() {
    auto settings = config::load_settings();
    if (settings.is_success()) {
        level_ = settings->log_level;
        sinks_.push_back(std::make_shared<ConsoleSink>(settings->colored));
    } else {
        sinks_.push_back(std::make_shared<ConsoleSink>());
        LogRecord warning;
        warning.level = LogLevel::WARN;
        warning.logger = "guard.config";
        warning.message = settings.error().message + " (using defaults)";
        sinks_.front()->write(warning);
    }
}

LogManager& LogManager::instance() {
    static LogManager manager;
    return manager;
}

SharedPtr<Logger> LogManager::get_logger(const String& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = loggers_.find(name);
    if (found != loggers_.end()) return found->second;

    auto logger = std::make_shared<Logger>(name, level_);
    logger->set_sinks(sinks_);
    loggers_.emplace(name, logger);
    return logger;
}

LogLevel LogManager::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void LogManager::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

void LogManager::add_sink(SharedPtr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    for (auto& [name, logger] : loggers_) {
        logger->set_sinks(sinks_);
    }
}

void LogManager::reset(LogLevel level, bool colored) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    sinks_ = {std::make_shared<ConsoleSink>(colored)};
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
        logger->set_sinks(sinks_);
    }
}

void LogManager::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace guard::logging
