/**
 * @file logger.hpp
 * @brief Console logging used by the listener and the message catalog
 *
 * Info and debug lines go to std::cout, warnings and errors to std::cerr.
 * Logging can be switched off globally, and lines below the minimum level
 * are dropped:
 *
 *   Logger::enabled = true;
 *   Logger::minLevel = LogLevel::Debug;
 *   Logger::debug("intercepted user-error");
 */

#pragma once

#include <iostream>
#include <string>

namespace usererror {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static bool enabled;
    static LogLevel minLevel;

    static void debug(const std::string& msg) {
        write(LogLevel::Debug, std::cout, "[DEBUG] ", msg);
    }

    static void info(const std::string& msg) {
        write(LogLevel::Info, std::cout, "[INFO] ", msg);
    }

    static void warn(const std::string& msg) {
        write(LogLevel::Warn, std::cerr, "[WARN] ", msg);
    }

    static void error(const std::string& msg) {
        write(LogLevel::Error, std::cerr, "[ERROR] ", msg);
    }

private:
    static void write(LogLevel level, std::ostream& out, const char* tag, const std::string& msg) {
        if (enabled && level >= minLevel) {
            out << tag << msg << std::endl;
        }
    }
};

inline bool Logger::enabled = true;
inline LogLevel Logger::minLevel = LogLevel::Info;

} // namespace usererror
