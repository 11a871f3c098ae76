#include "UplinkManager.h"
#include <string.h>

const char* linkStateName(LinkState state) {
    switch (state) {
        case LinkState::IDLE: return "IDLE";
        case LinkState::ASSOCIATING: return "ASSOCIATING";
        case LinkState::ASSOCIATED: return "ASSOCIATED";
        case LinkState::READY: return "READY";
    }
    return "UNKNOWN";
}

UplinkManager::UplinkManager(ILogger* log, const Config* cfg, IUplinkTransport* uplinkTransport)
    : logger(log), config(cfg), transport(uplinkTransport), state(LinkState::IDLE),
      credentialIndex(0), attemptStartedAt(0), sessionAttempted(false), lastSessionAttemptAt(0),
      timeSyncRequested(false), forcedDown(false), associationAttempts(0), sessionAttempts(0),
      publishedTotal(0), publishFailures(0) {
}

bool UplinkManager::initialize() {
    if (!transport) {
        if (logger) logger->error("Uplink transport missing");
        return false;
    }

    if (config->wifi.credentialCount == 0) {
        if (logger) logger->error("No WiFi credentials configured");
        return false;
    }

    if (!transport->initialize(config)) {
        if (logger) logger->error("Uplink transport initialization failed");
        return false;
    }

    return true;
}

void UplinkManager::setState(LinkState next) {
    if (next == state) return;
    if (logger) logger->infof("Uplink %s -> %s", linkStateName(state), linkStateName(next));
    state = next;
}

void UplinkManager::beginAttempt(uint32_t now) {
    const WiFiCredential& credential = config->wifi.credentials[credentialIndex];
    attemptStartedAt = now;
    associationAttempts++;
    setState(LinkState::ASSOCIATING);

    if (logger) logger->infof("Associating with \"%s\" (credential %u/%u)", credential.ssid,
                              (unsigned)(credentialIndex + 1),
                              (unsigned)config->wifi.credentialCount);

    // A refused start is treated like a failed attempt: the window still runs out.
    if (!transport->beginAssociation(credential)) {
        if (logger) logger->warningf("Association start refused for \"%s\"", credential.ssid);
    }
}

void UplinkManager::trySession(uint32_t now) {
    if (transport->isSessionReady()) {
        setState(LinkState::READY);
        return;
    }

    if (sessionAttempted && !elapsedSince(now, lastSessionAttemptAt, config->wifi.sessionRetryMs)) {
        return;
    }

    sessionAttempted = true;
    lastSessionAttemptAt = now;
    sessionAttempts++;

    if (transport->connectSession()) {
        if (logger) logger->infof("Broker session up (%s:%u)", config->mqtt.host,
                                  (unsigned)config->mqtt.port);
        setState(LinkState::READY);
    } else {
        if (logger) logger->warningf("Broker session to %s failed, retry in %lu ms",
                                     config->mqtt.host, (unsigned long)config->wifi.sessionRetryMs);
    }
}

void UplinkManager::tick(uint32_t now) {
    if (config->wifi.credentialCount == 0) return;

    switch (state) {
        case LinkState::IDLE:
            beginAttempt(now);
            break;

        case LinkState::ASSOCIATING:
            if (transport->isAssociated()) {
                setState(LinkState::ASSOCIATED);
                if (!timeSyncRequested) {
                    transport->requestTimeSync();
                    timeSyncRequested = true;
                }
                sessionAttempted = false;
                trySession(now);
            } else if (elapsedSince(now, attemptStartedAt, config->wifi.attemptTimeoutMs)) {
                if (logger) logger->warningf("Association with \"%s\" timed out",
                                             config->wifi.credentials[credentialIndex].ssid);
                credentialIndex = (credentialIndex + 1) % config->wifi.credentialCount;
                beginAttempt(now);
            }
            break;

        case LinkState::ASSOCIATED:
            if (!transport->isAssociated()) {
                if (logger) logger->warning("Association lost");
                beginAttempt(now);
            } else {
                trySession(now);
            }
            break;

        case LinkState::READY:
            if (!transport->isAssociated()) {
                if (logger) logger->warning("Association lost");
                beginAttempt(now);
            } else if (!transport->isSessionReady()) {
                if (logger) logger->warning("Broker session lost");
                setState(LinkState::ASSOCIATED);
                sessionAttempted = false;
                trySession(now);
            } else {
                transport->loop();
            }
            break;
    }
}

void UplinkManager::setForcedDown(bool down) {
    if (down == forcedDown) return;
    forcedDown = down;
    if (logger) logger->warningf("Forced uplink outage %s", down ? "ON" : "OFF");
}

bool UplinkManager::publish(const char* topic, const uint8_t* payload, size_t length) {
    if (!isEffective()) return false;

    if (!transport->publish(topic, payload, length)) {
        publishFailures++;
        if (logger) logger->debugf("Publish to %s failed (%u B)", topic, (unsigned)length);
        return false;
    }

    publishedTotal++;
    return true;
}

bool UplinkManager::publish(const char* topic, const char* json) {
    return publish(topic, (const uint8_t*)json, json ? strlen(json) : 0);
}

const char* UplinkManager::getCurrentSsid() const {
    return config->wifi.credentialCount > 0 ? config->wifi.credentials[credentialIndex].ssid : "";
}

int8_t UplinkManager::getRssi() const {
    return state == LinkState::IDLE || state == LinkState::ASSOCIATING ? 0 : transport->rssi();
}
