#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace updsrv {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Environment variable consulted for the initial level.
inline constexpr const char kLogLevelEnv[] = "UPDSRV_LOG_LEVEL";

// Lines go to stderr as
//   [time] [LEVEL] [T<n>] [file:line] message
// where T<n> numbers threads in order of their first log line.

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

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
    Logger();
};

#define LogDebug(...) ::updsrv::Logger::Instance().LogWithSource(::updsrv::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::updsrv::Logger::Instance().LogWithSource(::updsrv::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::updsrv::Logger::Instance().LogWithSource(::updsrv::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::updsrv::Logger::Instance().LogWithSource(::updsrv::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace updsrv
