#include "util/logger.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace fpack {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::string g_tag;

const char* LevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

// Empty when the local time is unavailable.
std::string Timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

void Logger::SetTag(std::string tag) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_tag = std::move(tag);
}

std::string Logger::Tag() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_tag;
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level) return;

    std::string prefix;
    if (const std::string ts = Timestamp(); !ts.empty()) {
        prefix += "[" + ts + "] ";
    }
    prefix += "[";
    prefix += LevelName(lvl);
    prefix += "] ";
    if (!g_tag.empty()) {
        prefix += "[" + g_tag + "] ";
    }
    const char* base = BaseName(file);
    if (base && line > 0 && lvl != LogLevel::Info) {
        prefix += std::string(base) + ":" + std::to_string(line) + ": ";
    }

    std::fputs(prefix.c_str(), stderr);
    std::vfprintf(stderr, fmt, ap);
    std::fputc('\n', stderr);
}

ScopedLogTag::ScopedLogTag(std::string tag) : previous_(Logger::Instance().Tag()) {
    Logger::Instance().SetTag(std::move(tag));
}

ScopedLogTag::~ScopedLogTag() { Logger::Instance().SetTag(std::move(previous_)); }

} // namespace fpack
