#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace packsmith {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view s);

// Process-wide stderr logger. Lines look like
// "2026-10-19T14:03:11Z WARN  step_processor.cpp:88 | message".
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    bool Enabled(LogLevel lvl) const;

    void Write(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

private:
    Logger() = default;

    void WriteV(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap);
};

#define PACKSMITH_LOG(lvl, ...) ::packsmith::Logger::Instance().Write((lvl), __FILE__, __LINE__, __VA_ARGS__)

#define LogDebug(...) PACKSMITH_LOG(::packsmith::LogLevel::Debug, __VA_ARGS__)
#define LogInfo(...)  PACKSMITH_LOG(::packsmith::LogLevel::Info, __VA_ARGS__)
#define LogWarn(...)  PACKSMITH_LOG(::packsmith::LogLevel::Warn, __VA_ARGS__)
#define LogError(...) PACKSMITH_LOG(::packsmith::LogLevel::Error, __VA_ARGS__)

} // namespace packsmith
