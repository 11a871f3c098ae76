#include "SerialLogger.h"

SerialLogger::SerialLogger(LogLevel level, bool timestamp)
    : currentLogLevel(level), useTimestamp(timestamp), startTime(millis()) {
}

const char* SerialLogger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT ";
        default: return "UNKN ";
    }
}

void SerialLogger::printPrefix(LogLevel level) const {
    if (useTimestamp) {
        uint32_t elapsed = millis() - startTime;
        unsigned long ms = elapsed % 1000;
        unsigned long seconds = elapsed / 1000;
        unsigned long hours = seconds / 3600;
        unsigned long minutes = (seconds / 60) % 60;
        seconds %= 60;
        Serial.printf("[%02lu:%02lu:%02lu.%03lu] ", hours, minutes, seconds, ms);
    }
    Serial.printf("[%s] ", getLevelString(level));
}

void SerialLogger::log(LogLevel level, const char* message) {
    if (!isEnabled(level)) return;

    printPrefix(level);
    Serial.println(message);
}

void SerialLogger::logf(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlogf(level, format, args);
    va_end(args);
}
