// Logger.h
#pragma once
#include <string>
#include <functional>

namespace rs {

enum class LogLevel {
    Info,
    Warning,
    Error
};

const char* LogLevelName(LogLevel level);

class Logger {
public:
    static void Log(const std::string& message);
    static void LogWarning(const std::string& message);
    static void LogError(const std::string& message);

    // With no callback installed, messages go to stdout/stderr.
    static void SetCallback(std::function<void(const std::string&, LogLevel)> cb) { s_Callback = cb; }
    static void ResetCallback() { s_Callback = nullptr; }

private:
    static void Write(const std::string& message, LogLevel level);

    static std::function<void(const std::string&, LogLevel)> s_Callback;
};

} // namespace rs
