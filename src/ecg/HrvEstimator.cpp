#include "HrvEstimator.h"

constexpr int HrvEstimator::HISTORY_SIZE;

HrvEstimator::HrvEstimator(const HrvConfig* cfg)
    : config(cfg), accepted(0), rejected(0) {
}

bool HrvEstimator::addInterval(float rrMs) {
    if (isnan(rrMs) || !config->isPlausibleRr(rrMs)) {
        rejected++;
        return false;
    }

    history.push(rrMs);
    accepted++;
    return true;
}

void HrvEstimator::reset() {
    history.clear();
    accepted = 0;
    rejected = 0;
}

float HrvEstimator::sdnn() const {
    if (!hasMinimum()) return NAN;

    int n = history.size();
    double sum = 0.0;
    for (int i = 0; i < n; i++) sum += history.at(i);
    double mean = sum / n;

    double squares = 0.0;
    for (int i = 0; i < n; i++) {
        double delta = history.at(i) - mean;
        squares += delta * delta;
    }

    return (float)sqrt(squares / n);
}

float HrvEstimator::rmssd() const {
    if (!hasMinimum()) return NAN;

    int n = history.size();
    double squares = 0.0;
    for (int i = 1; i < n; i++) {
        double delta = history.at(i) - history.at(i - 1);
        squares += delta * delta;
    }

    return (float)sqrt(squares / (n - 1));
}

float HrvEstimator::pnn50() const {
    if (!hasMinimum()) return NAN;

    int n = history.size();
    int over = 0;
    for (int i = 1; i < n; i++) {
        if (fabs(history.at(i) - history.at(i - 1)) > 50.0) over++;
    }

    return 100.0f * (float)over / (float)(n - 1);
}

HrvMetrics HrvEstimator::compute() const {
    return HrvMetrics(rmssd(), sdnn(), pnn50(), history.size());
}
