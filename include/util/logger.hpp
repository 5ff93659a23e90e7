#pragma once

#include <cstdarg>
#include <optional>
#include <string>

namespace imgjoin {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Log lines and status lines both go to stdout; fatal errors are printed by
// the caller on stderr.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);

    // printf-style logging
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

    // Plain status line on stdout, no prefix, printed when `lvl` passes the
    // level filter.
    void Status(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

private:
    Logger() = default;
};

#define LogDebug(...) ::imgjoin::Logger::Instance().LogWithSource(::imgjoin::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogStatus(...)     ::imgjoin::Logger::Instance().Status(::imgjoin::LogLevel::Info, __VA_ARGS__)
#define LogStatusWarn(...) ::imgjoin::Logger::Instance().Status(::imgjoin::LogLevel::Warn, __VA_ARGS__)

} // namespace imgjoin
