#include "HeartRateParser.h"

constexpr int HeartSample::MAX_RR;
constexpr uint8_t HeartRateParser::FLAG_BPM_16BIT;
constexpr uint8_t HeartRateParser::FLAG_ENERGY_EXPENDED;
constexpr uint8_t HeartRateParser::FLAG_RR_PRESENT;

bool HeartRateParser::parse(const uint8_t* data, size_t length, HeartSample& sample) {
    sample = HeartSample();
    if (!data || length < 2) return false;

    uint8_t flags = data[0];
    size_t offset = 1;

    if (flags & FLAG_BPM_16BIT) {
        if (length < offset + 2) return false;
        sample.bpm = (uint16_t)(data[offset] | (data[offset + 1] << 8));
        offset += 2;
    } else {
        sample.bpm = data[offset];
        offset += 1;
    }

    if (flags & FLAG_ENERGY_EXPENDED) {
        if (length < offset + 2) return false;
        offset += 2;
    }

    if (flags & FLAG_RR_PRESENT) {
        while (offset + 2 <= length && sample.rrCount < HeartSample::MAX_RR) {
            uint16_t ticks = (uint16_t)(data[offset] | (data[offset + 1] << 8));
            sample.rrIntervalsMs[sample.rrCount++] = rrTicksToMs(ticks);
            offset += 2;
        }
    }

    return true;
}
