#ifndef HRV_ESTIMATOR_H
#define HRV_ESTIMATOR_H

#include <math.h>
#include <stddef.h>
#include "../../include/Config.h"

// Fixed-size ring of recent RR intervals; overwrites oldest first.
template<int Capacity = 32>
class RrHistory {
private:
    float buffer[Capacity];
    int count;
    int index;

public:
    RrHistory() : count(0), index(0) {}

    void clear() { count = 0; index = 0; }

    void push(float value) {
        buffer[index] = value;
        index = (index + 1) % Capacity;
        if (count < Capacity) count++;
    }

    int size() const { return count; }
    static int capacity() { return Capacity; }

    // i = 0 is the oldest retained interval.
    float at(int i) const {
        int start = (count < Capacity) ? 0 : index;
        return buffer[(start + i) % Capacity];
    }

    float newest() const {
        return count > 0 ? buffer[(index + Capacity - 1) % Capacity] : NAN;
    }
};

struct HrvMetrics {
    float rmssdMs;
    float sdnnMs;
    float pnn50Pct;
    int count;

    HrvMetrics(float rmssd = NAN, float sdnn = NAN, float pnn50 = NAN, int n = 0)
        : rmssdMs(rmssd), sdnnMs(sdnn), pnn50Pct(pnn50), count(n) {}

    bool isValid() const {
        return !isnan(rmssdMs) && !isnan(sdnnMs);
    }
};

// HRV statistics over the RR ring. Every metric is NAN ("unavailable")
// until the ring holds the configured minimum number of intervals.
class HrvEstimator {
public:
    static constexpr int HISTORY_SIZE = 32;

private:
    const HrvConfig* config;
    RrHistory<HISTORY_SIZE> history;
    uint32_t accepted;
    uint32_t rejected;

    bool hasMinimum() const { return history.size() >= (int)config->minSamples; }

public:
    explicit HrvEstimator(const HrvConfig* cfg);

    // Implausible intervals are dropped silently (counted only).
    bool addInterval(float rrMs);
    void reset();

    float sdnn() const;
    float rmssd() const;
    float pnn50() const;
    HrvMetrics compute() const;

    int size() const { return history.size(); }
    float latestRrMs() const { return history.newest(); }
    uint32_t getAccepted() const { return accepted; }
    uint32_t getRejected() const { return rejected; }
};

#endif
