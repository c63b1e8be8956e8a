#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace oops {

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    if (text == "error" || text == "0") return LogLevel::Error;
    if (text == "warn" || text == "1") return LogLevel::Warn;
    if (text == "info" || text == "2") return LogLevel::Info;
    if (text == "debug" || text == "3") return LogLevel::Debug;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(LogLevel::Info) {
    if (const char* env = std::getenv("OOPS_LOG")) {
        currentLevel = parseLevel(env).value_or(LogLevel::Info);
    }
}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::error(const std::string& msg) const { if (enabled(LogLevel::Error)) std::cerr << "oops: error: " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (enabled(LogLevel::Warn)) std::cerr << "oops: warning: " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (enabled(LogLevel::Info)) std::cout << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (enabled(LogLevel::Debug)) std::cout << "[debug] " << msg << "\n"; }

}
