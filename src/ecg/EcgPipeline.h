#ifndef ECG_PIPELINE_H
#define ECG_PIPELINE_H

#include "../../include/Config.h"
#include "../../include/ILogger.h"
#include "../core/PacketQueue.h"
#include "../wearable/WearableClient.h"
#include "BeatDetector.h"
#include "EcgBundler.h"
#include "HrvEstimator.h"

struct PipelineCounters {
    uint32_t packetsPushed;
    uint32_t packetsDropped;
    uint32_t packetsOversize;
    uint32_t bundlesBuilt;
    uint32_t beatsDetected;
    uint32_t rrRejected;

    PipelineCounters()
        : packetsPushed(0), packetsDropped(0), packetsOversize(0), bundlesBuilt(0),
          beatsDetected(0), rrRejected(0) {}
};

// Queue -> bundles for the uplink, and samples -> beats -> HRV on the side.
// While ECG is off, RR intervals from the heart rate service feed the same
// history.
class EcgPipeline : public IEcgPacketConsumer, public IHeartSampleConsumer {
private:
    ILogger* logger;
    const Config* config;

    PacketQueue queue;
    EcgBundler bundler;
    BeatDetector detector;
    HrvEstimator hrv;

    bool ecgActive;
    bool bundleTimerStarted;
    uint32_t lastBundleAt;
    size_t bundleLength;

    uint32_t samplesDecoded;
    uint32_t packetsUndecodable;

    static constexpr size_t MAX_SAMPLES_PER_PACKET = 168;

public:
    EcgPipeline(ILogger* log, const Config* cfg);

    PacketQueue* getQueue() { return &queue; }

    // Builds at most one bundle per bundle interval. Returns its length,
    // 0 when nothing was pending or the interval has not elapsed.
    size_t service(uint32_t now);
    const uint8_t* bundleData() const { return bundler.data(); }
    size_t lastBundleLength() const { return bundleLength; }

    void setEcgActive(bool active);
    bool isEcgActive() const { return ecgActive; }
    void setSampleRate(uint16_t hz);

    HrvMetrics getHrv() const { return hrv.compute(); }
    float getDetectorBpm() const { return detector.getBpm(); }
    float getLatestRrMs() const { return hrv.latestRrMs(); }
    PipelineCounters getCounters() const;

    void onEcgPacket(const uint8_t* data, size_t length) override;
    void onHeartSample(const HeartSample& sample) override;
};

#endif
