/**
 * @file logger.cpp
 * @brief Logger singleton and level-name helpers.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

namespace cmdkit {
namespace utils {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

std::string Logger::levelName(LogLevel level) {
    return trim(logLevelToString(level));
}

std::optional<LogLevel> logLevelFromString(const std::string& name) {
    std::string upper = to_upper(trim(name));
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF") return LogLevel::OFF;
    return std::nullopt;
}

}  // namespace utils
}  // namespace cmdkit
