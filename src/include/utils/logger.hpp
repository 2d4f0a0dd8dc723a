#pragma once
#include <string>
#include <memory>
#include <cstdio>
#include <cstdarg>

namespace pdfstack {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void set_colors(bool enabled);
    bool enabled(LogLevel level) const { return level_ <= level; }
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    bool colors_ = true;
};

// Map the integer verbosity used in config files (0 quiet, 1 summary, 2 verbose)
LogLevel log_level_from_verbosity(int verbosity);

} // namespace pdfstack
