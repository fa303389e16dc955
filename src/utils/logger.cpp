/**
 * @file logger.cpp
 * @brief Logger singleton and level parsing.
 *
 * @copyright Copyright (c) 2024 dmsd Contributors
 * @license MIT License
 */

#include "dmsd/utils/logger.hpp"

namespace dmsd {
namespace utils {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    static const struct {
        const char* name;
        LogLevel level;
    } kLevels[] = {
        {"TRACE", LogLevel::TRACE},
        {"DEBUG", LogLevel::DEBUG},
        {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},
        {"ERROR", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL},
        {"OFF", LogLevel::OFF},
    };

    for (const auto& entry : kLevels) {
        if (name == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

}  // namespace utils
}  // namespace dmsd
