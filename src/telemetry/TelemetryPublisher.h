#ifndef TELEMETRY_PUBLISHER_H
#define TELEMETRY_PUBLISHER_H

#include "../../include/Config.h"
#include "../../include/IClock.h"
#include "../../include/IEnvironmentSensor.h"
#include "../../include/ILogger.h"
#include "../ecg/EcgPipeline.h"
#include "../failover/FailoverController.h"
#include "../relay/RelayLink.h"
#include "../uplink/UplinkManager.h"
#include "../wearable/WearableClient.h"
#include "TelemetrySerializer.h"

struct PublishCounters {
    uint32_t sent;
    uint32_t failed;
    uint32_t capsulesSent;
    uint32_t bundlesSent;

    PublishCounters() : sent(0), failed(0), capsulesSent(0), bundlesSent(0) {}
};

class IntervalTimer {
private:
    bool started;
    uint32_t last;

public:
    IntervalTimer() : started(false), last(0) {}

    bool due(uint32_t now, uint32_t interval) {
        if (started && !elapsedSince(now, last, interval)) return false;
        started = true;
        last = now;
        return true;
    }
};

/**
 * Pulls the latest state of every component on three timers and routes it:
 * DIRECT goes out through the uplink, anything else as a Capsule over the
 * relay link. Also republishes sibling capsules while this node is the
 * gateway, and answers capsule requests while it is not.
 */
class TelemetryPublisher : public ICapsuleSource, public ICapsuleSink {
private:
    ILogger* logger;
    const Config* config;
    IClock* clock;
    UplinkManager* uplink;
    RelayLink* link;
    FailoverController* failover;
    WearableClient* wearable;
    EcgPipeline* pipeline;
    IEnvironmentSensor* environmentSensor;

    IntervalTimer biomedicalTimer;
    IntervalTimer environmentTimer;
    IntervalTimer healthTimer;

    EnvironmentReading latestEnvironment;
    PublishCounters counters;

    char topicBuffer[TelemetrySerializer::MAX_TOPIC_BYTES];
    char jsonBuffer[TelemetrySerializer::MAX_JSON_BYTES];
    char timestamp[32];

    MessageTags ownTags();
    MessageTags relayedTags(const RelaySibling& sibling);
    bool send(const char* topic, const char* json, size_t length);

    void publishBiomedical(uint32_t now);
    void publishEnvironment();
    void publishHealth(uint32_t now);
    void publishEcgBundle(size_t length);
    void sendCapsuleToRelay();

public:
    TelemetryPublisher(ILogger* log, const Config* cfg, IClock* clock, UplinkManager* uplink,
                       RelayLink* link, FailoverController* failover, WearableClient* wearable,
                       EcgPipeline* pipeline, IEnvironmentSensor* environmentSensor);

    void tick(uint32_t now);

    bool buildCapsule(Capsule& capsule) override;
    bool onSiblingCapsule(const RelaySibling& sibling, const Capsule& capsule) override;

    const EnvironmentReading& getLatestEnvironment() const { return latestEnvironment; }
    const PublishCounters& getCounters() const { return counters; }
};

#endif
