#include "EcgPipeline.h"
#include "../wearable/PmdProtocol.h"

constexpr size_t EcgPipeline::MAX_SAMPLES_PER_PACKET;

EcgPipeline::EcgPipeline(ILogger* log, const Config* cfg)
    : logger(log), config(cfg),
      queue(cfg->ecg.queueCapacity, cfg->ecg.maxPacketBytes),
      bundler(log, cfg->ecg.bundleBudgetBytes, cfg->ecg.maxPacketBytes),
      detector(&cfg->hrv, (float)cfg->ecg.sampleRateHz), hrv(&cfg->hrv),
      ecgActive(false), bundleTimerStarted(false), lastBundleAt(0), bundleLength(0),
      samplesDecoded(0), packetsUndecodable(0) {
}

size_t EcgPipeline::service(uint32_t now) {
    if (bundleTimerStarted && !elapsedSince(now, lastBundleAt, config->ecg.bundleIntervalMs)) {
        return 0;
    }
    bundleTimerStarted = true;
    lastBundleAt = now;

    bundleLength = bundler.build(queue, now, this);
    return bundleLength;
}

void EcgPipeline::setEcgActive(bool active) {
    if (active == ecgActive) return;
    ecgActive = active;
    detector.reset();
    if (logger) logger->debugf("Beat source: %s", active ? "ECG detector" : "heart rate RR");
}

void EcgPipeline::setSampleRate(uint16_t hz) {
    if (hz == 0 || (float)hz == detector.getSampleRate()) return;
    detector.setSampleRate((float)hz);
    detector.reset();
    if (logger) logger->infof("ECG sample rate set to %u Hz", (unsigned)hz);
}

void EcgPipeline::onEcgPacket(const uint8_t* data, size_t length) {
    int32_t samples[MAX_SAMPLES_PER_PACKET];
    int count = PmdProtocol::decodeEcgSamples(data, length, samples, MAX_SAMPLES_PER_PACKET);
    if (count < 0) {
        packetsUndecodable++;
        return;
    }

    for (int i = 0; i < count; i++) {
        float rrMs;
        if (detector.push((float)samples[i], rrMs)) {
            hrv.addInterval(rrMs);
        }
    }
    samplesDecoded += (uint32_t)count;
}

void EcgPipeline::onHeartSample(const HeartSample& sample) {
    if (ecgActive) return;
    for (int i = 0; i < sample.rrCount; i++) {
        hrv.addInterval(sample.rrIntervalsMs[i]);
    }
}

PipelineCounters EcgPipeline::getCounters() const {
    PipelineCounters counters;
    counters.packetsPushed = queue.getPushedTotal();
    counters.packetsDropped = queue.getDroppedTotal();
    counters.packetsOversize = queue.getRejectedTotal() + bundler.getOversizeDropped();
    counters.bundlesBuilt = bundler.getBundlesBuilt();
    counters.beatsDetected = detector.getBeatsDetected();
    counters.rrRejected = detector.getRrRejected() + hrv.getRejected();
    return counters;
}
