#ifndef BEAT_DETECTOR_H
#define BEAT_DETECTOR_H

#include <stdint.h>
#include "../../include/Config.h"

/**
 * Single-pass R-peak detector, one sample at a time.
 *
 * baseline  <- slow EMA of x          (detrend: d = x - baseline)
 * envelope  <- fast EMA of |d|
 * threshold  = envelope * gain + offset
 *
 * A peak opens when d crosses the threshold outside the refractory period,
 * tracks its maximum, and closes when d falls below half the threshold.
 */
class BeatDetector {
private:
    const HrvConfig* config;
    float sampleRateHz;
    uint32_t refractorySamples;

    bool primed;
    float baseline;
    float envelope;

    bool inPeak;
    float peakValue;
    uint32_t peakIndex;

    bool havePeak;
    uint32_t lastPeakIndex;
    uint32_t sampleIndex;

    float lastRrMs;
    uint32_t beatsDetected;
    uint32_t rrRejected;

public:
    BeatDetector(const HrvConfig* cfg, float sampleRateHz);

    // Returns true when this sample closes a beat with a plausible RR interval.
    bool push(float sample, float& rrMs);

    void setSampleRate(float hz);
    void reset();

    float getLastRrMs() const { return lastRrMs; }
    float getBpm() const;
    float getThreshold() const;
    uint32_t getBeatsDetected() const { return beatsDetected; }
    uint32_t getRrRejected() const { return rrRejected; }
    float getSampleRate() const { return sampleRateHz; }
};

#endif
