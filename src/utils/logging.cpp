#include "qline/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace qline::utils {

namespace {

constexpr const char* LOGGER_NAME = "qline";

struct LevelName {
    std::string_view name;
    LogLevel level;
};

// Canonical name first for each level; the rest are accepted aliases
constexpr std::array<LevelName, 11> LEVEL_NAMES = {{
    {"trace", LogLevel::TRACE},
    {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},
    {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},
    {"error", LogLevel::ERROR},
    {"err", LogLevel::ERROR},
    {"critical", LogLevel::CRITICAL},
    {"fatal", LogLevel::CRITICAL},
    {"off", LogLevel::OFF},
    {"none", LogLevel::OFF},
}};

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

void init_logging(LogLevel level, const std::string& pattern) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(pattern.empty() ? DEFAULT_LOG_PATTERN : pattern);
    set_log_level(level);
}

void set_log_level(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}

const char* log_level_to_string(LogLevel level) {
    auto it = std::find_if(LEVEL_NAMES.begin(), LEVEL_NAMES.end(),
                           [level](const LevelName& entry) { return entry.level == level; });
    return it != LEVEL_NAMES.end() ? it->name.data() : "info";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : LEVEL_NAMES) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

LogLevel string_to_log_level(const std::string& str) {
    return parse_log_level(str).value_or(LogLevel::INFO);
}

}  // namespace qline::utils
