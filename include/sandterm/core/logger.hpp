#ifndef sandterm_CORE_LOGGER_HPP
#define sandterm_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <mutex>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace sandterm {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error"; anything else maps to INFO
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (tests point this at a tmpfile). Defaults to stderr.
    void set_output(FILE* out);
    
    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);
    
    LogLevel level_;
    FILE* out_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) sandterm::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  sandterm::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  sandterm::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) sandterm::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace sandterm

#endif // sandterm_CORE_LOGGER_HPP
