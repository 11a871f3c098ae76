#ifndef HEART_RATE_PARSER_H
#define HEART_RATE_PARSER_H

#include <stddef.h>
#include <stdint.h>

struct HeartSample {
    static constexpr int MAX_RR = 9;

    uint16_t bpm;
    float rrIntervalsMs[MAX_RR];
    int rrCount;

    HeartSample() : bpm(0), rrCount(0) {}
};

// Heart Rate Measurement characteristic (0x2A37).
class HeartRateParser {
public:
    static constexpr uint8_t FLAG_BPM_16BIT = 0x01;
    static constexpr uint8_t FLAG_ENERGY_EXPENDED = 0x08;
    static constexpr uint8_t FLAG_RR_PRESENT = 0x10;

    // RR fields arrive in 1/1024 s ticks.
    static float rrTicksToMs(uint16_t ticks) { return ticks * 1000.0f / 1024.0f; }

    // False if the notification is shorter than its flags promise.
    static bool parse(const uint8_t* data, size_t length, HeartSample& sample);
};

#endif
