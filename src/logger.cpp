#include "logger.hpp"
#include <cstdio>
#include <iostream>
#include <unistd.h>

LogLevel Logger::level = LogLevel::INFO;
bool Logger::color = isatty(fileno(stderr)) != 0;

static const char* tagFor(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::NONE:  break;
    }
    return "";
}

static const std::string& colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return ansi::red;
        case LogLevel::WARN:  return ansi::yellow;
        case LogLevel::INFO:  return ansi::white;
        default:              return ansi::gray;
    }
}

void Logger::write(LogLevel messageLevel, const std::string& msg) {
    if (!enabled(messageLevel))
        return;

    if (color)
        std::cerr << colorFor(messageLevel);
    std::cerr << "[chunkdig][" << tagFor(messageLevel) << "] " << msg;
    if (color)
        std::cerr << ansi::reset;
    std::cerr << "\n";
}
