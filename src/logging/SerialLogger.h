#ifndef SERIAL_LOGGER_H
#define SERIAL_LOGGER_H

#include <Arduino.h>
#include "../../include/ILogger.h"

// Writes "[hh:mm:ss.mmm] [LEVEL] message" lines to the USB serial port.
class SerialLogger : public ILogger {
private:
    LogLevel currentLogLevel;
    bool useTimestamp;
    uint32_t startTime;

    static const char* getLevelString(LogLevel level);
    void printPrefix(LogLevel level) const;

public:
    SerialLogger(LogLevel level = LogLevel::INFO, bool timestamp = true);

    void log(LogLevel level, const char* message) override;
    void logf(LogLevel level, const char* format, ...) override;
    void setLogLevel(LogLevel level) override { currentLogLevel = level; }
    LogLevel getLogLevel() const override { return currentLogLevel; }

    void setUseTimestamp(bool use) { useTimestamp = use; }
};

#endif
