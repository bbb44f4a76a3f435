#pragma once

#include <cstdarg>
#include <string>

namespace fpack {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Process-wide stderr logger. Lines carry a timestamp, the level, an optional
// job tag and, for non-Info levels, the source location.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Tag prefixed to every line, e.g. "job 2/3". Empty disables it.
    void SetTag(std::string tag);
    std::string Tag() const;

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

// Sets the logger tag for the lifetime of the object, restoring the previous one.
class ScopedLogTag {
public:
    explicit ScopedLogTag(std::string tag);
    ~ScopedLogTag();

    ScopedLogTag(const ScopedLogTag&) = delete;
    ScopedLogTag& operator=(const ScopedLogTag&) = delete;

private:
    std::string previous_;
};

#define LogDebug(...) ::fpack::Logger::Instance().LogWithSource(::fpack::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::fpack::Logger::Instance().LogWithSource(::fpack::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::fpack::Logger::Instance().LogWithSource(::fpack::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::fpack::Logger::Instance().LogWithSource(::fpack::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace fpack
