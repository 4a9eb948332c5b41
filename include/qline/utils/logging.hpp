#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <string_view>

namespace qline::utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL,
    OFF
};

// Time, level and thread ahead of the message; roles are tagged by callers
inline constexpr const char* DEFAULT_LOG_PATTERN = "%H:%M:%S.%e %^%-5l%$ qline[%t] %v";

// Install the "qline" logger on stderr as the default logger. stdout is
// left to application output. Safe to call more than once.
void init_logging(LogLevel level = LogLevel::INFO, const std::string& pattern = DEFAULT_LOG_PATTERN);

void set_log_level(LogLevel level);

const char* log_level_to_string(LogLevel level);

// Case-insensitive; nullopt for a name that is not a level
std::optional<LogLevel> parse_log_level(std::string_view name);

// As parse_log_level, falling back to INFO
LogLevel string_to_log_level(const std::string& str);

}  // namespace qline::utils
