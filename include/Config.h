#ifndef CONFIG_H
#define CONFIG_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include "ILogger.h"

static constexpr size_t MAX_ID_LENGTH = 24;
static constexpr size_t MAX_WIFI_CREDENTIALS = 4;
static constexpr size_t MAX_RELAY_SIBLINGS = 4;
static constexpr size_t MAC_LENGTH = 6;

inline void copyField(char* dst, size_t size, const char* src) {
    if (size == 0) return;
    strncpy(dst, src ? src : "", size - 1);
    dst[size - 1] = '\0';
}

// Read-only after boot; stamped on every outgoing message.
struct NodeIdentity {
    char teamId[MAX_ID_LENGTH];
    char wearerId[MAX_ID_LENGTH];
    char nodeId[MAX_ID_LENGTH];
    uint8_t relayId;

    NodeIdentity(const char* team = "", const char* wearer = "",
                 const char* node = "", uint8_t relay = 0)
        : relayId(relay) {
        copyField(teamId, sizeof(teamId), team);
        copyField(wearerId, sizeof(wearerId), wearer);
        copyField(nodeId, sizeof(nodeId), node);
    }
};

struct WiFiCredential {
    char ssid[33];
    char password[65];

    WiFiCredential(const char* s = "", const char* p = "") {
        copyField(ssid, sizeof(ssid), s);
        copyField(password, sizeof(password), p);
    }
};

struct WiFiConfig {
    WiFiCredential credentials[MAX_WIFI_CREDENTIALS];
    size_t credentialCount;
    uint32_t attemptTimeoutMs;
    uint32_t sessionRetryMs;

    WiFiConfig(uint32_t attemptTimeout = 12000, uint32_t sessionRetry = 5000)
        : credentialCount(0), attemptTimeoutMs(attemptTimeout), sessionRetryMs(sessionRetry) {}

    bool addCredential(const char* ssid, const char* password) {
        if (!ssid || ssid[0] == '\0' || credentialCount >= MAX_WIFI_CREDENTIALS) return false;
        credentials[credentialCount++] = WiFiCredential(ssid, password);
        return true;
    }
};

struct MqttConfig {
    char host[64];
    uint16_t port;
    char clientId[32];
    char username[32];
    char password[64];
    uint16_t keepAliveSec;
    uint16_t connectTimeoutMs;     // TCP connect to the broker
    char topicNamespace[16];
    char ecgTopicPrefix[16];

    MqttConfig(const char* h = "", uint16_t p = 1883, uint16_t keepAlive = 30,
               uint16_t connectTimeout = 300)
        : port(p), keepAliveSec(keepAlive), connectTimeoutMs(connectTimeout) {
        copyField(host, sizeof(host), h);
        clientId[0] = '\0';
        username[0] = '\0';
        password[0] = '\0';
        copyField(topicNamespace, sizeof(topicNamespace), "ngsi");
        copyField(ecgTopicPrefix, sizeof(ecgTopicPrefix), "raw/ECG");
    }
};

struct RelaySibling {
    uint8_t mac[MAC_LENGTH];
    uint8_t relayId;
    char nodeId[MAX_ID_LENGTH];
    char teamId[MAX_ID_LENGTH];
    char wearerId[MAX_ID_LENGTH];

    RelaySibling() : relayId(0) {
        memset(mac, 0, sizeof(mac));
        nodeId[0] = '\0';
        teamId[0] = '\0';
        wearerId[0] = '\0';
    }
};

struct RelayConfig {
    uint8_t channel;
    uint32_t beaconIntervalMs;
    uint32_t staleWindowMs;
    uint32_t forwardRequestIntervalMs;     // 0 disables the pull variant
    RelaySibling siblings[MAX_RELAY_SIBLINGS];
    size_t siblingCount;

    RelayConfig(uint8_t ch = 1, uint32_t beacon = 1000, uint32_t stale = 4000,
                uint32_t forwardRequest = 2000)
        : channel(ch), beaconIntervalMs(beacon), staleWindowMs(stale),
          forwardRequestIntervalMs(forwardRequest), siblingCount(0) {}

    bool addSibling(const uint8_t mac[MAC_LENGTH], uint8_t relayId, const char* nodeId,
                    const char* teamId, const char* wearerId) {
        if (siblingCount >= MAX_RELAY_SIBLINGS) return false;
        RelaySibling& s = siblings[siblingCount++];
        memcpy(s.mac, mac, MAC_LENGTH);
        s.relayId = relayId;
        copyField(s.nodeId, sizeof(s.nodeId), nodeId);
        copyField(s.teamId, sizeof(s.teamId), teamId);
        copyField(s.wearerId, sizeof(s.wearerId), wearerId);
        return true;
    }
};

struct FailoverConfig {
    uint32_t failoverDelayMs;
    uint32_t recoverDelayMs;

    FailoverConfig(uint32_t failover = 8000, uint32_t recover = 15000)
        : failoverDelayMs(failover), recoverDelayMs(recover) {}
};

struct WearableConfig {
    char namePrefix[24];
    uint32_t scanDurationMs;
    uint32_t reconnectIntervalMs;
    uint16_t desiredMtu;
    uint32_t handshakeTimeoutMs;
    uint32_t ecgRetryIntervalMs;
    bool ecgOnlyWhenDirect;

    WearableConfig(const char* prefix = "Polar H10", uint32_t scan = 5000,
                   uint32_t reconnect = 15000, uint16_t mtu = 232,
                   uint32_t handshake = 2000, uint32_t ecgRetry = 30000)
        : scanDurationMs(scan), reconnectIntervalMs(reconnect), desiredMtu(mtu),
          handshakeTimeoutMs(handshake), ecgRetryIntervalMs(ecgRetry),
          ecgOnlyWhenDirect(true) {
        copyField(namePrefix, sizeof(namePrefix), prefix);
    }
};

struct EcgConfig {
    size_t queueCapacity;
    size_t maxPacketBytes;
    size_t bundleBudgetBytes;
    uint32_t bundleIntervalMs;
    uint16_t sampleRateHz;

    EcgConfig(size_t capacity = 32, size_t maxPacket = 244, size_t budget = 1024,
              uint32_t interval = 500, uint16_t rate = 130)
        : queueCapacity(capacity), maxPacketBytes(maxPacket), bundleBudgetBytes(budget),
          bundleIntervalMs(interval), sampleRateHz(rate) {}
};

struct HrvConfig {
    float baselineAlpha;
    float envelopeAlpha;
    float thresholdGain;
    float thresholdOffset;
    uint32_t refractoryMs;
    uint32_t minRrMs;
    uint32_t maxRrMs;
    size_t minSamples;

    HrvConfig()
        : baselineAlpha(0.01f), envelopeAlpha(0.05f), thresholdGain(3.0f),
          thresholdOffset(80.0f), refractoryMs(220), minRrMs(250), maxRrMs(2000),
          minSamples(5) {}

    bool isPlausibleRr(float rrMs) const {
        return rrMs >= (float)minRrMs && rrMs <= (float)maxRrMs;
    }
};

struct PublishConfig {
    uint32_t biomedicalIntervalMs;
    uint32_t environmentIntervalMs;
    uint32_t healthIntervalMs;
    char sourceTag[16];

    PublishConfig(uint32_t bio = 1000, uint32_t env = 2000, uint32_t health = 5000)
        : biomedicalIntervalMs(bio), environmentIntervalMs(env), healthIntervalMs(health) {
        copyField(sourceTag, sizeof(sourceTag), "ffnode");
    }
};

struct PinConfig {
    uint8_t sdaPin;
    uint8_t sclPin;
    uint8_t gasAnalogPin;
    uint8_t gasDigitalPin;
    uint8_t ledPin;

    PinConfig(uint8_t sda = 21, uint8_t scl = 22, uint8_t gasAnalog = 34,
              uint8_t gasDigital = 35, uint8_t led = 2)
        : sdaPin(sda), sclPin(scl), gasAnalogPin(gasAnalog),
          gasDigitalPin(gasDigital), ledPin(led) {}
};

class Config {
public:
    NodeIdentity identity;
    WiFiConfig wifi;
    MqttConfig mqtt;
    RelayConfig relay;
    FailoverConfig failover;
    WearableConfig wearable;
    EcgConfig ecg;
    HrvConfig hrv;
    PublishConfig publish;
    PinConfig pins;

    void loadFromDefaults();
    bool validate(ILogger* logger) const;
    void print(ILogger* logger) const;

    const RelaySibling* findSibling(uint8_t relayId) const;
    const RelaySibling* findSibling(const uint8_t mac[MAC_LENGTH]) const;
};

#endif
