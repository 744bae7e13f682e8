/*
 * ctxkeep C++ - Logger
 *
 * Leveled printf-style logging to stderr. Safe to call from several
 * producer threads; each record is written as one locked unit.
 */
#ifndef ctxkeep_CORE_LOGGER_HPP
#define ctxkeep_CORE_LOGGER_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <utility>

namespace ctxkeep {

#ifdef __GNUC__
#  define CTXKEEP_API __attribute__((visibility("default")))
#  define CTXKEEP_PRINTF(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#  define CTXKEEP_API
#  define CTXKEEP_PRINTF(fmt_idx, args_idx)
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error". Unknown names yield `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class CTXKEEP_API Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (defaults to stderr). Pass nullptr to restore stderr.
    void set_output(FILE* out);

    // Member functions carry an implicit `this`, so the format index is 5.
    void debug(const char* file, int line, const char* func, const char* fmt, ...) CTXKEEP_PRINTF(5, 6);
    void info(const char* file, int line, const char* func, const char* fmt, ...) CTXKEEP_PRINTF(5, 6);
    void warn(const char* file, int line, const char* func, const char* fmt, ...) CTXKEEP_PRINTF(5, 6);
    void error(const char* file, int line, const char* func, const char* fmt, ...) CTXKEEP_PRINTF(5, 6);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    FILE* out_;
    std::mutex write_mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) ctxkeep::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  ctxkeep::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  ctxkeep::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) ctxkeep::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace ctxkeep

#endif // ctxkeep_CORE_LOGGER_HPP
