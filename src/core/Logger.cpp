#include "core/Logger.h"

#include <iostream>

namespace rs {

std::function<void(const std::string&, LogLevel)> Logger::s_Callback;

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error: return "Error";
    }
    return "Info";
}

void Logger::Log(const std::string& message) {
    Write(message, LogLevel::Info);
}
void Logger::LogWarning(const std::string& message) {
    Write(message, LogLevel::Warning);
}
void Logger::LogError(const std::string& message) {
    Write(message, LogLevel::Error);
}

void Logger::Write(const std::string& message, LogLevel level) {
    if (s_Callback) {
        s_Callback(message, level);
        return;
    }
    if (level == LogLevel::Info)
        std::cout << message << std::endl;
    else
        std::cerr << "[" << LogLevelName(level) << "] " << message << std::endl;
}

} // namespace rs
