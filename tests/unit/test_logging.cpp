#include "../framework/test_framework.hpp"
#include "guard/common/logging.hpp"
#include "guard/precondition/precondition.hpp"
#include <mutex>
#include <stdexcept>

using namespace guard;
using namespace guard::logging;
using namespace guard::test;

namespace {

// Keeps every record it receives.
class CaptureSink : public LogSink {
private:
    Vector<LogRecord> records_;
    mutable std::mutex mutex_;

public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] Vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool has(StringView logger, StringView fragment) const {
        for (const auto& record : records()) {
            if (record.logger == logger && record.message.find(fragment) != String::npos) return true;
        }
        return false;
    }
};

// Routes the manager to a fresh capture sink at DEBUG.
SharedPtr<CaptureSink> capture_debug() {
    auto& manager = LogManager::instance();
    manager.reset(LogLevel::OFF, false);
    auto sink = std::make_shared<CaptureSink>();
    manager.add_sink(sink);
    manager.set_level(LogLevel::DBG);
    return sink;
}

}

void test_parse_level() {
    ASSERT_TRUE(parse_level("debug") == LogLevel::DBG);
    ASSERT_TRUE(parse_level("DBG") == LogLevel::DBG);
    ASSERT_TRUE(parse_level(" Warning ") == LogLevel::WARN);
    ASSERT_TRUE(parse_level("err") == LogLevel::ERR);
    ASSERT_TRUE(parse_level("off") == LogLevel::OFF);
    ASSERT_FALSE(parse_level("verbose").has_value());
    ASSERT_FALSE(parse_level("").has_value());
    ASSERT_EQ(to_string(LogLevel::DBG), "DEBUG");
}

void test_record_format() {
    LogRecord record;
    record.level = LogLevel::WARN;
    record.logger = "guard.test";
    record.message = "disk nearly full";

    String plain = record.format();
    ASSERT_TRUE(plain.find("[ WARN] [guard.test] disk nearly full") != String::npos);
    ASSERT_TRUE(plain.find("\033[") == String::npos);

    String colored = record.format(true);
    ASSERT_TRUE(colored.find("\033[33m[ WARN]\033[0m") != String::npos);
}

void test_logger_level_filter() {
    auto sink = std::make_shared<CaptureSink>();
    Logger logger("guard.filter", LogLevel::WARN);
    logger.add_sink(sink);

    logger.info("dropped {}", 1);
    logger.warn("kept {}", 2);
    logger.error("kept {}", 3);

    auto records = sink->records();
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0].message, "kept 2");
    ASSERT_TRUE(records[1].level == LogLevel::ERR);

    logger.set_level(LogLevel::OFF);
    logger.error("silenced");
    ASSERT_EQ(sink->records().size(), 2u);
}

void test_manager_shares_level_and_sinks() {
    auto& manager = LogManager::instance();
    auto logger = manager.get_logger("guard.shared");
    ASSERT_EQ(manager.get_logger("guard.shared").get(), logger.get());

    // Loggers handed out earlier follow later changes.
    auto sink = capture_debug();
    ASSERT_TRUE(logger->level() == LogLevel::DBG);
    logger->debug("hello {}", "sinks");
    ASSERT_TRUE(sink->has("guard.shared", "hello sinks"));

    manager.set_level(LogLevel::ERR);
    ASSERT_FALSE(logger->enabled(LogLevel::WARN));
    ASSERT_TRUE(manager.level() == LogLevel::ERR);
}

void test_precondition_failure_logged() {
    auto sink = capture_debug();

    ASSERT_THROW(precondition::require_positive(-4), PreconditionFailedException);
    ASSERT_TRUE(sink->has("guard.precondition", "ILLEGAL_NUMBER Number must be positive but -4 was given"));

    for (const auto& record : sink->records()) {
        ASSERT_TRUE(record.level == LogLevel::DBG);
    }

    auto before = sink->records().size();
    ASSERT_NO_THROW(precondition::require_positive(4));
    ASSERT_EQ(sink->records().size(), before);
}

void test_override_failure_logged() {
    auto sink = capture_debug();

    auto error = std::make_exception_ptr(std::domain_error("custom"));
    ASSERT_THROW(precondition::require_true(false, error), std::domain_error);
    ASSERT_TRUE(sink->has("guard.precondition", "(override raised)"));
}

void test_failures_silent_above_debug() {
    auto sink = capture_debug();
    LogManager::instance().set_level(LogLevel::INFO);

    ASSERT_THROW(precondition::require_non_blank(""), PreconditionFailedException);
    ASSERT_TRUE(sink->records().empty());
}

int main() {
    TestSuite suite("Logging Tests");

    suite.add_test("parse_level", test_parse_level);
    suite.add_test("Record format", test_record_format);
    suite.add_test("Logger level filter", test_logger_level_filter);
    suite.add_test("Manager shares level and sinks", test_manager_shares_level_and_sinks);
    suite.add_test("Precondition failure logged", test_precondition_failure_logged);
    suite.add_test("Override failure logged", test_override_failure_logged);
    suite.add_test("Failures silent above DEBUG", test_failures_silent_above_debug);

    TestRunner runner;
    runner.add_suite(&suite);
    int failed = runner.run_all();
    LogManager::instance().flush();
    return failed;
}
