#ifndef ARDUINO_CLOCK_H
#define ARDUINO_CLOCK_H

#include <Arduino.h>
#include <time.h>
#include "../../include/IClock.h"

class ArduinoClock : public IClock {
private:
    // Anything earlier means SNTP has not set the clock yet.
    static constexpr time_t MIN_VALID_EPOCH = 1700000000;

public:
    uint32_t monotonicMs() const override { return millis(); }

    bool utcTimestamp(char* buffer, size_t length) const override {
        time_t now = time(nullptr);
        if (now < MIN_VALID_EPOCH) return false;

        struct tm utc;
        gmtime_r(&now, &utc);
        return strftime(buffer, length, "%Y-%m-%dT%H:%M:%SZ", &utc) > 0;
    }
};

#endif
