#pragma once
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string bold    = "\033[1m";
    const std::string cyan    = "\033[36m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string green   = "\033[32m";
    const std::string magenta = "\033[35m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}
enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

// Process-wide logger writing "[chunkdig][level] message" lines to stderr.
// Colour is on only when stderr is a terminal, unless set explicitly.
class Logger {
public:
    static LogLevel level;
    static bool color;

    static void setLevel(LogLevel newLevel) { level = newLevel; }
    static void setColor(bool enabled) { color = enabled; }
    static bool enabled(LogLevel messageLevel) { return messageLevel != LogLevel::NONE && level >= messageLevel; }

    static void debug(const std::string& msg) { write(LogLevel::DEBUG, msg); }
    static void info(const std::string& msg)  { write(LogLevel::INFO, msg); }
    static void warn(const std::string& msg)  { write(LogLevel::WARN, msg); }
    static void error(const std::string& msg) { write(LogLevel::ERROR, msg); }

private:
    static void write(LogLevel messageLevel, const std::string& msg);
};
