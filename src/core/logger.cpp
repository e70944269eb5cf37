#include <sandterm/core/logger.hpp>

namespace sandterm {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m"; // Reset
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

// "void sandterm::DockerRuntime::start(const string&)" -> {"DockerRuntime", "start"}
static std::pair<std::string, std::string> split_pretty_function(const char* pretty_function) {
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
    std::string scope = signature.substr(0, last_colon);
    size_t space_pos = scope.rfind(' ');
    if (space_pos != std::string::npos) {
        scope = scope.substr(space_pos + 1);
    }

    size_t template_pos = scope.find('<');
    if (template_pos != std::string::npos) {
        scope = scope.substr(0, template_pos);
    }
    if (!scope.empty() && scope[0] == '*') {
        scope = scope.substr(1);
    }
    if (scope.compare(0, 10, "sandterm::") == 0) {
        scope = scope.substr(10);
    }

    return {scope, func_name};
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : stderr;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
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

    // Invocation workers, the audit writer and gateway readers all log
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ == LogLevel::DEBUG) {
        auto [scope, func_name] = split_pretty_function(func);
        if (!scope.empty()) {
            fprintf(out_, "[%s] %s[%s]\033[0m \033[36m(%s::%s)\033[0m at \033[33m%s:%d\033[0m ",
                    timestamp, color, level_str, scope.c_str(), func_name.c_str(), file, line);
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

} // namespace sandterm
