#include "util/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <time.h>

namespace updsrv {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

// "YYYY-mm-dd HH:MM:SS.mmm" local time, or empty when the clock is unusable.
std::size_t FormatTimestamp(char* buf, std::size_t buf_len) {
    timespec now{};
    std::tm tm{};
    if (buf_len == 0 || ::clock_gettime(CLOCK_REALTIME, &now) != 0 || localtime_r(&now.tv_sec, &tm) == nullptr) {
        return 0;
    }
    std::size_t n = std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
    if (n == 0) return 0;
    const int ms = std::snprintf(buf + n, buf_len - n, ".%03ld", now.tv_nsec / 1000000L);
    if (ms > 0 && static_cast<std::size_t>(ms) < buf_len - n) n += static_cast<std::size_t>(ms);
    return n;
}

unsigned ThreadTag() {
    static std::atomic<unsigned> next{1};
    thread_local const unsigned tag = next.fetch_add(1, std::memory_order_relaxed);
    return tag;
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "none")  return LogLevel::None;
    return std::nullopt;
}

Logger::Logger() {
    const char* env = std::getenv(kLogLevelEnv);
    if (!env || !*env) return;
    if (auto lvl = ParseLogLevel(env)) {
        g_level = *lvl;
    } else {
        std::fprintf(stderr, "[WARN] ignoring %s=%s\n", kLogLevelEnv, env);
    }
}

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

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
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
    {
        std::lock_guard<std::mutex> lk(g_mu);
        if (lvl < g_level) return;
    }

    // Whole line is assembled first so one fwrite keeps concurrent lines apart.
    char line_buf[1024];
    std::size_t used = 0;
    auto room = [&]() { return sizeof(line_buf) - used; };
    auto advance = [&](int n) {
        if (n > 0) used += std::min(static_cast<std::size_t>(n), room() - 1);
    };

    char ts[40]{};
    if (FormatTimestamp(ts, sizeof(ts)) > 0) advance(std::snprintf(line_buf + used, room(), "[%s] ", ts));
    advance(std::snprintf(line_buf + used, room(), "[%s] [T%u] ", ToStr(lvl), ThreadTag()));
    const char* base = BaseName(file);
    if (base && line > 0) advance(std::snprintf(line_buf + used, room(), "[%s:%d] ", base, line));
    advance(std::vsnprintf(line_buf + used, room(), fmt, ap));
    line_buf[used++] = '\n';

    std::lock_guard<std::mutex> lk(g_mu);
    std::fwrite(line_buf, 1, used, stderr);
}

} // namespace updsrv
