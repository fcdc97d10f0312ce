#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace imgbuild {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view s);
const char* LogLevelName(LogLevel lvl);

// Process-wide diagnostics sink. Build progress goes to the status display,
// not here.

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    // Defaults to stderr. nullptr restores the default.
    void SetOutput(std::FILE* out);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::imgbuild::Logger::Instance().LogWithSource(::imgbuild::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::imgbuild::Logger::Instance().LogWithSource(::imgbuild::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::imgbuild::Logger::Instance().LogWithSource(::imgbuild::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::imgbuild::Logger::Instance().LogWithSource(::imgbuild::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace imgbuild
