#include "BeatDetector.h"
#include <math.h>

BeatDetector::BeatDetector(const HrvConfig* cfg, float rateHz)
    : config(cfg), sampleRateHz(rateHz), refractorySamples(0) {
    setSampleRate(rateHz);
    reset();
}

void BeatDetector::setSampleRate(float hz) {
    if (!(hz > 0.0f)) return;
    sampleRateHz = hz;
    refractorySamples = (uint32_t)lroundf(config->refractoryMs * sampleRateHz / 1000.0f);
}

void BeatDetector::reset() {
    primed = false;
    baseline = 0.0f;
    envelope = 0.0f;
    inPeak = false;
    peakValue = 0.0f;
    peakIndex = 0;
    havePeak = false;
    lastPeakIndex = 0;
    sampleIndex = 0;
    lastRrMs = NAN;
    beatsDetected = 0;
    rrRejected = 0;
}

float BeatDetector::getThreshold() const {
    return envelope * config->thresholdGain + config->thresholdOffset;
}

float BeatDetector::getBpm() const {
    if (isnan(lastRrMs) || lastRrMs <= 0.0f) return NAN;
    return 60000.0f / lastRrMs;
}

bool BeatDetector::push(float sample, float& rrMs) {
    uint32_t index = sampleIndex++;

    if (!primed) {
        baseline = sample;
        primed = true;
    }

    baseline += config->baselineAlpha * (sample - baseline);
    float detrended = sample - baseline;
    envelope += config->envelopeAlpha * (fabsf(detrended) - envelope);
    float threshold = getThreshold();

    if (!inPeak) {
        bool refractoryOver = !havePeak || (index - lastPeakIndex) >= refractorySamples;
        if (detrended > threshold && refractoryOver) {
            inPeak = true;
            peakValue = detrended;
            peakIndex = index;
        }
        return false;
    }

    if (detrended > peakValue) {
        peakValue = detrended;
        peakIndex = index;
    }

    if (detrended >= threshold * 0.5f) return false;

    inPeak = false;
    beatsDetected++;

    bool hadPeak = havePeak;
    uint32_t previous = lastPeakIndex;
    havePeak = true;
    lastPeakIndex = peakIndex;
    if (!hadPeak) return false;

    float interval = (float)(peakIndex - previous) * 1000.0f / sampleRateHz;
    if (!config->isPlausibleRr(interval)) {
        rrRejected++;
        return false;
    }

    lastRrMs = interval;
    rrMs = interval;
    return true;
}
