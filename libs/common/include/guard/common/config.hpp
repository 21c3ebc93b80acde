#pragma once
// =============================================================================
// Guard Preconditions - Configuration (C++20)
// Version: 1.0.0
// Ambient settings read from GUARD_* environment variables
// =============================================================================

#include "guard/common/types.hpp"
#include "guard/common/error.hpp"
#include "guard/common/logging.hpp"

namespace guard::config {

namespace env {
    constexpr StringView LOG_LEVEL = "GUARD_LOG_LEVEL";   // trace|debug|info|warn|error|fatal|off
    constexpr StringView LOG_COLOR = "GUARD_LOG_COLOR";   // on|off, yes|no, true|false, 1|0
}

struct Settings {
    logging::LogLevel log_level = logging::LogLevel::INFO;
    bool colored = true;
};

[[nodiscard]] Optional<String> get_env(StringView name);

[[nodiscard]] Result<bool> parse_flag(StringView text);

// Unset variables keep their defaults. A variable that is set but cannot be
// understood fails with CONFIG_ERROR naming it.
[[nodiscard]] Result<Settings> load_settings();

void apply_settings(const Settings& settings);

} // namespace guard::config
