#include <ctxkeep/core/logger.hpp>
#include <ctxkeep/core/utils.hpp>

namespace ctxkeep {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m";
    }
}

static const char* get_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// "bool ctxkeep::ContextStore::add(...)" -> {"ContextStore", "add"}
static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", ""};
    }

    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return {"", func_name};
    }

    std::string func_name = signature.substr(last_colon + 2);

    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name = (space_pos != std::string::npos)
        ? before_last_colon.substr(space_pos + 1)
        : before_last_colon;

    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }

    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }

    if (starts_with(class_name, "ctxkeep::")) {
        class_name = class_name.substr(9);
    }
    // Free functions directly in the namespace
    if (class_name == "ctxkeep") {
        class_name.clear();
    }

    return {class_name, func_name};
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

#ifdef __GNUC__
__attribute__((visibility("default")))
#endif
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ = out ? out : stderr;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level() > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO), out_(stderr) {}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* color = get_color_code(level);
    const char* level_str = get_level_str(level);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (level_.load() == LogLevel::DEBUG) {
        auto [class_name, func_name] = extract_class_and_function(func);
        if (!class_name.empty()) {
            fprintf(out_, "[%s] %s[%s]\033[0m \033[36m(%s::%s)\033[0m at \033[33m%s:%d\033[0m ",
                    timestamp, color, level_str, class_name.c_str(), func_name.c_str(), file, line);
        } else {
            fprintf(out_, "[%s] %s[%s]\033[0m \033[36m(%s)\033[0m at \033[33m%s:%d\033[0m ",
                    timestamp, color, level_str, func_name.c_str(), file, line);
        }
    } else {
        fprintf(out_, "[%s] %s[%s]\033[0m ", timestamp, color, level_str);
    }
    vfprintf(out_, fmt, args);
    fprintf(out_, "\n");
    fflush(out_);
}

} // namespace ctxkeep
