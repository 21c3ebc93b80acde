#include "../framework/test_framework.hpp"
#include "guard/common/config.hpp"
#include <cstdlib>

using namespace guard;
using namespace guard::config;
using namespace guard::test;

namespace {

void set_env(StringView name, const char* value) {
    ::setenv(String(name).c_str(), value, 1);
}

void clear_env() {
    ::unsetenv(String(env::LOG_LEVEL).c_str());
    ::unsetenv(String(env::LOG_COLOR).c_str());
}

}

void test_get_env() {
    set_env("GUARD_TEST_VALUE", "present");
    ASSERT_EQ(get_env("GUARD_TEST_VALUE").value(), "present");
    ::unsetenv("GUARD_TEST_VALUE");
    ASSERT_FALSE(get_env("GUARD_TEST_VALUE").has_value());
}

void test_parse_flag() {
    ASSERT_TRUE(parse_flag("on").value());
    ASSERT_TRUE(parse_flag(" Yes ").value());
    ASSERT_TRUE(parse_flag("1").value());
    ASSERT_FALSE(parse_flag("off").value());
    ASSERT_FALSE(parse_flag("FALSE").value());

    auto bad = parse_flag("sometimes");
    ASSERT_TRUE(bad.is_error());
    ASSERT_EQ(bad.error().code, ErrorCode::CONFIG_ERROR);
}

void test_defaults_without_environment() {
    clear_env();
    auto settings = load_settings();
    ASSERT_TRUE(settings.is_success());
    ASSERT_TRUE(settings->log_level == logging::LogLevel::INFO);
    ASSERT_TRUE(settings->colored);
}

void test_environment_values() {
    set_env(env::LOG_LEVEL, "debug");
    set_env(env::LOG_COLOR, "off");
    auto settings = load_settings();
    clear_env();

    ASSERT_TRUE(settings.is_success());
    ASSERT_TRUE(settings->log_level == logging::LogLevel::DBG);
    ASSERT_FALSE(settings->colored);
}

void test_unknown_level_rejected() {
    set_env(env::LOG_LEVEL, "chatty");
    auto settings = load_settings();
    clear_env();

    ASSERT_TRUE(settings.is_error());
    ASSERT_EQ(settings.error().code, ErrorCode::CONFIG_ERROR);
    ASSERT_TRUE(settings.error().message.find("GUARD_LOG_LEVEL") != String::npos);
    ASSERT_TRUE(settings.error().message.find("chatty") != String::npos);
}

void test_bad_color_rejected() {
    set_env(env::LOG_COLOR, "purple");
    auto settings = load_settings();
    clear_env();

    ASSERT_TRUE(settings.is_error());
    ASSERT_TRUE(settings.error().message.find("GUARD_LOG_COLOR") != String::npos);
}

void test_apply_settings() {
    auto logger = logging::LogManager::instance().get_logger("guard.config.test");

    Settings settings;
    settings.log_level = logging::LogLevel::WARN;
    settings.colored = false;
    apply_settings(settings);

    ASSERT_TRUE(logging::LogManager::instance().level() == logging::LogLevel::WARN);
    ASSERT_TRUE(logger->level() == logging::LogLevel::WARN);
    ASSERT_FALSE(logger->enabled(logging::LogLevel::INFO));
}

int main() {
    TestSuite suite("Configuration Tests");

    suite.add_test("get_env", test_get_env);
    suite.add_test("parse_flag", test_parse_flag);
    suite.add_test("Defaults without environment", test_defaults_without_environment);
    suite.add_test("Environment values", test_environment_values);
    suite.add_test("Unknown level rejected", test_unknown_level_rejected);
    suite.add_test("Bad color rejected", test_bad_color_rejected);
    suite.add_test("apply_settings", test_apply_settings);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
