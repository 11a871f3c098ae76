#include "TelemetryPublisher.h"

TelemetryPublisher::TelemetryPublisher(ILogger* log, const Config* cfg, IClock* systemClock,
                                       UplinkManager* uplinkManager, RelayLink* relayLink,
                                       FailoverController* failoverController,
                                       WearableClient* wearableClient, EcgPipeline* ecgPipeline,
                                       IEnvironmentSensor* sensor)
    : logger(log), config(cfg), clock(systemClock), uplink(uplinkManager), link(relayLink),
      failover(failoverController), wearable(wearableClient), pipeline(ecgPipeline),
      environmentSensor(sensor) {
    topicBuffer[0] = '\0';
    jsonBuffer[0] = '\0';
    timestamp[0] = '\0';
}

void TelemetryPublisher::tick(uint32_t now) {
    bool direct = failover->isDirect();

    size_t bundleLength = pipeline->service(now);
    if (bundleLength > 0 && direct) publishEcgBundle(bundleLength);

    if (environmentTimer.due(now, config->publish.environmentIntervalMs)) {
        if (environmentSensor && environmentSensor->isReady()) {
            latestEnvironment = environmentSensor->read();
        }
        if (direct) publishEnvironment();
    }

    if (biomedicalTimer.due(now, config->publish.biomedicalIntervalMs)) {
        if (direct) publishBiomedical(now);
        else sendCapsuleToRelay();
    }

    if (healthTimer.due(now, config->publish.healthIntervalMs) && direct) {
        publishHealth(now);
    }
}

MessageTags TelemetryPublisher::ownTags() {
    MessageTags tags;
    tags.teamId = config->identity.teamId;
    tags.ffId = config->identity.wearerId;
    tags.nodeId = config->identity.nodeId;
    tags.originNodeId = config->identity.nodeId;
    tags.via = "wifi";
    tags.failover = false;
    tags.forwardHopCount = 0;
    tags.source = config->publish.sourceTag;
    tags.observedAt = clock->utcTimestamp(timestamp, sizeof(timestamp)) ? timestamp : nullptr;
    return tags;
}

MessageTags TelemetryPublisher::relayedTags(const RelaySibling& sibling) {
    MessageTags tags = ownTags();
    tags.teamId = sibling.teamId;
    tags.ffId = sibling.wearerId;
    tags.originNodeId = sibling.nodeId;
    tags.via = "relay";
    tags.failover = true;
    tags.forwardHopCount = 1;
    return tags;
}

bool TelemetryPublisher::send(const char* topic, const char* json, size_t length) {
    if (length == 0) {
        counters.failed++;
        if (logger) logger->warningf("Payload for %s did not fit, skipped", topic);
        return false;
    }

    if (!uplink->publish(topic, (const uint8_t*)json, length)) {
        counters.failed++;
        return false;
    }

    counters.sent++;
    return true;
}

void TelemetryPublisher::publishBiomedical(uint32_t now) {
    BiomedicalRecord record;
    record.tags = ownTags();
    record.wearableOk = wearable->isWearableOk(now);
    if (record.wearableOk) record.hrBpm = (float)wearable->getLatestSample().bpm;

    record.rrMs = pipeline->getLatestRrMs();
    if (isnan(record.rrMs)) record.rrMs = wearable->getLatestRrMs();

    HrvMetrics hrv = pipeline->getHrv();
    record.rmssdMs = hrv.rmssdMs;
    record.sdnnMs = hrv.sdnnMs;
    record.pnn50Pct = hrv.pnn50Pct;

    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.topicNamespace,
                               "Biomedical", config->identity.teamId, config->identity.wearerId);
    size_t length = TelemetrySerializer::biomedical(record, jsonBuffer, sizeof(jsonBuffer));
    send(topicBuffer, jsonBuffer, length);
}

void TelemetryPublisher::publishEnvironment() {
    EnvironmentRecord record;
    record.tags = ownTags();
    record.tempC = latestEnvironment.tempC;
    record.humidityPct = latestEnvironment.humidityPct;
    record.gasRaw = latestEnvironment.gasRaw;
    record.gasDigital = latestEnvironment.gasDigital;
    record.coPpm = latestEnvironment.coPpm;
    record.radioRssiDbm = uplink->getRssi();

    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.topicNamespace,
                               "Environment", config->identity.teamId, config->identity.wearerId);
    size_t length = TelemetrySerializer::environment(record, jsonBuffer, sizeof(jsonBuffer));
    send(topicBuffer, jsonBuffer, length);
}

void TelemetryPublisher::publishHealth(uint32_t now) {
    PipelineCounters ecg = pipeline->getCounters();

    GatewayHealthRecord record;
    record.nodeId = config->identity.nodeId;
    record.observedAt = clock->utcTimestamp(timestamp, sizeof(timestamp)) ? timestamp : nullptr;
    record.uplinkReal = uplink->isReal();
    record.uplinkEffective = uplink->isEffective();
    record.radioRssiDbm = uplink->getRssi();
    record.bleOk = wearable->isWearableOk(now);
    record.ecgOn = wearable->isEcgStreaming();
    record.ecgPacketsTotal = ecg.packetsPushed;
    record.ecgDropTotal = ecg.packetsDropped + ecg.packetsOversize;
    record.mode = failoverStateName(failover->getState());
    record.relayPeers = (uint32_t)link->viablePeerCount(now);
    record.capsulesForwarded = link->getCapsulesForwarded();

    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.topicNamespace,
                               "Gateway", config->identity.nodeId, nullptr);
    size_t length = TelemetrySerializer::gatewayHealth(record, jsonBuffer, sizeof(jsonBuffer));
    send(topicBuffer, jsonBuffer, length);
}

void TelemetryPublisher::publishEcgBundle(size_t length) {
    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.ecgTopicPrefix,
                               nullptr, config->identity.teamId, config->identity.wearerId);

    if (uplink->publish(topicBuffer, pipeline->bundleData(), length)) {
        counters.bundlesSent++;
    } else {
        counters.failed++;
    }
}

void TelemetryPublisher::sendCapsuleToRelay() {
    // Stranded nodes only answer forward requests.
    const RelaySibling* relay = failover->getCurrentRelay();
    if (!relay) return;

    Capsule capsule;
    if (!buildCapsule(capsule)) return;
    if (link->sendCapsule(*relay, capsule)) counters.capsulesSent++;
}

bool TelemetryPublisher::buildCapsule(Capsule& capsule) {
    uint32_t now = clock->monotonicMs();
    HrvMetrics hrv = pipeline->getHrv();

    capsule = Capsule();
    capsule.bleOk = wearable->isWearableOk(now);
    capsule.bpm = capsule.bleOk ? wearable->getLatestSample().bpm : 0;
    capsule.rmssdMs = hrv.rmssdMs;
    capsule.sdnnMs = hrv.sdnnMs;
    capsule.gasRaw = latestEnvironment.gasRaw >= 0 ? (uint16_t)latestEnvironment.gasRaw : 0;
    capsule.temperatureC = latestEnvironment.tempC;
    capsule.rssi = (int8_t)uplink->getRssi();
    capsule.uplinkOk = uplink->isEffective();
    capsule.ecgOn = wearable->isEcgStreaming();
    return true;
}

bool TelemetryPublisher::onSiblingCapsule(const RelaySibling& sibling, const Capsule& capsule) {
    BiomedicalRecord bio;
    bio.tags = relayedTags(sibling);
    bio.wearableOk = capsule.bleOk;
    if (capsule.bleOk && capsule.bpm > 0) bio.hrBpm = (float)capsule.bpm;
    bio.rmssdMs = capsule.rmssdMs;
    bio.sdnnMs = capsule.sdnnMs;

    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.topicNamespace,
                               "Biomedical", sibling.teamId, sibling.wearerId);
    size_t length = TelemetrySerializer::biomedical(bio, jsonBuffer, sizeof(jsonBuffer));
    bool bioSent = send(topicBuffer, jsonBuffer, length);

    EnvironmentRecord env;
    env.tags = relayedTags(sibling);
    env.tempC = capsule.temperatureC;
    env.gasRaw = capsule.gasRaw;
    env.radioRssiDbm = capsule.rssi;

    TelemetrySerializer::topic(topicBuffer, sizeof(topicBuffer), config->mqtt.topicNamespace,
                               "Environment", sibling.teamId, sibling.wearerId);
    length = TelemetrySerializer::environment(env, jsonBuffer, sizeof(jsonBuffer));
    bool envSent = send(topicBuffer, jsonBuffer, length);

    if (logger) logger->debugf("Capsule #%u from %s republished (%s)", (unsigned)capsule.seq,
                               sibling.nodeId, bioSent && envSent ? "ok" : "partial");
    return bioSent && envSent;
}
