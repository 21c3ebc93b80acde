#include "guard/common/config.hpp"
#include <cstdlib>

namespace guard::config {

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value == nullptr) return std::nullopt;
    return String(value);
}

Result<bool> parse_flag(StringView text) {
    const String flag = to_upper(trim(text));
    if (flag == "1" || flag == "ON" || flag == "YES" || flag == "TRUE") return make_success(true);
    if (flag == "0" || flag == "OFF" || flag == "NO" || flag == "FALSE") return make_success(false);
    return ErrorInfo(ErrorCode::CONFIG_ERROR, std::format("Not a flag: '{}'", text), "config");
}

Result<Settings> load_settings() {
    Settings settings;

    if (auto level_name = get_env(env::LOG_LEVEL)) {
        auto level = logging::parse_level(*level_name);
        if (!level) {
            return ErrorInfo(ErrorCode::CONFIG_ERROR,
                std::format("{}: unknown log level '{}'", env::LOG_LEVEL, *level_name), "config");
        }
        settings.log_level = *level;
    }

    if (auto color = get_env(env::LOG_COLOR)) {
        auto flag = parse_flag(*color);
        if (flag.is_error()) {
            return ErrorInfo(ErrorCode::CONFIG_ERROR,
                std::format("{}: {}", env::LOG_COLOR, flag.error().message), "config");
        }
        settings.colored = flag.value();
    }

    return settings;
}

void apply_settings(const Settings& settings) {
    logging::LogManager::instance().reset(settings.log_level, settings.colored);
}

} // namespace guard::config
