#ifndef ILOGGER_H
#define ILOGGER_H

#include <stdarg.h>
#include <stdio.h>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Components hold an ILogger* that may be null; every call site is guarded.
// Never call from radio callbacks.
class ILogger {
public:
    static constexpr size_t LINE_LENGTH = 256;

    virtual ~ILogger() = default;
    virtual void log(LogLevel level, const char* message) = 0;
    virtual void logf(LogLevel level, const char* format, ...) = 0;
    virtual void setLogLevel(LogLevel level) = 0;
    virtual LogLevel getLogLevel() const = 0;

    bool isEnabled(LogLevel level) const { return level >= getLogLevel(); }

    void debug(const char* message) { log(LogLevel::DEBUG, message); }
    void info(const char* message) { log(LogLevel::INFO, message); }
    void warning(const char* message) { log(LogLevel::WARNING, message); }
    void error(const char* message) { log(LogLevel::ERROR, message); }
    void critical(const char* message) { log(LogLevel::CRITICAL, message); }

    void debugf(const char* format, ...) {
        va_list args; va_start(args, format);
        vlogf(LogLevel::DEBUG, format, args);
        va_end(args);
    }

    void infof(const char* format, ...) {
        va_list args; va_start(args, format);
        vlogf(LogLevel::INFO, format, args);
        va_end(args);
    }

    void warningf(const char* format, ...) {
        va_list args; va_start(args, format);
        vlogf(LogLevel::WARNING, format, args);
        va_end(args);
    }

    void errorf(const char* format, ...) {
        va_list args; va_start(args, format);
        vlogf(LogLevel::ERROR, format, args);
        va_end(args);
    }

protected:
    void vlogf(LogLevel level, const char* format, va_list args) {
        if (!isEnabled(level)) return;
        char buffer[LINE_LENGTH];
        vsnprintf(buffer, sizeof(buffer), format, args);
        log(level, buffer);
    }
};

#endif
