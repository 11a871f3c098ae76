#include "../../include/Config.h"
#include "../../node_configs.h"

void Config::loadFromDefaults() {
    identity = NodeIdentity(NODE_CONFIG_TEAM_ID, NODE_CONFIG_WEARER_ID,
                            NODE_CONFIG_NODE_ID, NODE_CONFIG_RELAY_ID);

    wifi = WiFiConfig();
    wifi.addCredential(NODE_CONFIG_WIFI_SSID_1, NODE_CONFIG_WIFI_PASSWORD_1);
    wifi.addCredential(NODE_CONFIG_WIFI_SSID_2, NODE_CONFIG_WIFI_PASSWORD_2);
    wifi.addCredential(NODE_CONFIG_WIFI_SSID_3, NODE_CONFIG_WIFI_PASSWORD_3);

    mqtt = MqttConfig(NODE_CONFIG_MQTT_HOST, NODE_CONFIG_MQTT_PORT);
    copyField(mqtt.clientId, sizeof(mqtt.clientId), NODE_CONFIG_NODE_ID);
    copyField(mqtt.username, sizeof(mqtt.username), NODE_CONFIG_MQTT_USERNAME);
    copyField(mqtt.password, sizeof(mqtt.password), NODE_CONFIG_MQTT_PASSWORD);

    relay = RelayConfig(NODE_CONFIG_RELAY_CHANNEL);
    const uint8_t sibling1[MAC_LENGTH] = NODE_CONFIG_SIBLING_1_MAC;
    relay.addSibling(sibling1, NODE_CONFIG_SIBLING_1_RELAY_ID, NODE_CONFIG_SIBLING_1_NODE_ID,
                     NODE_CONFIG_SIBLING_1_TEAM_ID, NODE_CONFIG_SIBLING_1_WEARER_ID);

    failover = FailoverConfig();
    wearable = WearableConfig(NODE_CONFIG_WEARABLE_PREFIX);
    ecg = EcgConfig();
    hrv = HrvConfig();
    publish = PublishConfig();
    pins = PinConfig();
}

bool Config::validate(ILogger* logger) const {
    if (identity.teamId[0] == '\0' || identity.wearerId[0] == '\0' || identity.nodeId[0] == '\0') {
        if (logger) logger->error("Node identity incomplete (team, wearer and node id required)");
        return false;
    }

    if (wifi.credentialCount == 0) {
        if (logger) logger->error("No WiFi credentials configured");
        return false;
    }

    if (wifi.attemptTimeoutMs < 1000 || wifi.attemptTimeoutMs > 60000) {
        if (logger) logger->error("WiFi attempt window must be between 1-60 seconds");
        return false;
    }

    if (mqtt.host[0] == '\0' || mqtt.port == 0) {
        if (logger) logger->error("MQTT broker not configured");
        return false;
    }

    if (mqtt.connectTimeoutMs < 50 || mqtt.connectTimeoutMs > 1000) {
        if (logger) logger->error("MQTT connect timeout must be between 50-1000 ms");
        return false;
    }

    if (relay.channel < 1 || relay.channel > 13) {
        if (logger) logger->error("Relay channel must be between 1-13");
        return false;
    }

    if (relay.staleWindowMs <= relay.beaconIntervalMs) {
        if (logger) logger->error("Relay stale window must exceed the beacon interval");
        return false;
    }

    for (size_t i = 0; i < relay.siblingCount; i++) {
        if (relay.siblings[i].relayId == identity.relayId) {
            if (logger) logger->errorf("Sibling %s shares this node's relay id %u",
                                       relay.siblings[i].nodeId, identity.relayId);
            return false;
        }
    }

    if (failover.failoverDelayMs == 0 || failover.recoverDelayMs == 0) {
        if (logger) logger->error("Failover and recovery delays must be non-zero");
        return false;
    }

    if (failover.failoverDelayMs == failover.recoverDelayMs) {
        if (logger) logger->errorf("Recovery delay must differ from failover delay (both %lu ms)",
                                   (unsigned long)failover.failoverDelayMs);
        return false;
    }

    if (ecg.queueCapacity < 2 || ecg.queueCapacity > 256) {
        if (logger) logger->error("ECG queue capacity must be between 2-256 packets");
        return false;
    }

    if (ecg.maxPacketBytes == 0 || ecg.maxPacketBytes > 512) {
        if (logger) logger->error("ECG packet size must be between 1-512 bytes");
        return false;
    }

    // One max-size packet must always fit an empty bundle: 9-byte header + 2-byte length.
    if (ecg.bundleBudgetBytes < ecg.maxPacketBytes + 11) {
        if (logger) logger->errorf("ECG bundle budget %u too small for %u-byte packets",
                                   (unsigned)ecg.bundleBudgetBytes, (unsigned)ecg.maxPacketBytes);
        return false;
    }

    if (ecg.sampleRateHz == 0) {
        if (logger) logger->error("ECG sample rate must be non-zero");
        return false;
    }

    if (hrv.minRrMs >= hrv.maxRrMs || hrv.minSamples < 2) {
        if (logger) logger->error("HRV plausibility band or minimum sample count invalid");
        return false;
    }

    if (publish.biomedicalIntervalMs < 100 || publish.environmentIntervalMs < 100 ||
        publish.healthIntervalMs < 100) {
        if (logger) logger->error("Publish intervals must be at least 100 ms");
        return false;
    }

    return true;
}

void Config::print(ILogger* logger) const {
    if (!logger) return;

    logger->info("================ CONFIGURATION ================");

    logger->info("[Identity]");
    logger->infof("Team: %s  Wearer: %s  Node: %s  Relay id: %u",
                  identity.teamId, identity.wearerId, identity.nodeId, identity.relayId);

    logger->info("[WiFi]");
    for (size_t i = 0; i < wifi.credentialCount; i++) {
        logger->infof("SSID %u: %s (password %u chars)", (unsigned)(i + 1),
                      wifi.credentials[i].ssid, (unsigned)strlen(wifi.credentials[i].password));
    }
    logger->infof("Attempt window: %lu ms  Session retry: %lu ms",
                  (unsigned long)wifi.attemptTimeoutMs, (unsigned long)wifi.sessionRetryMs);

    logger->info("[MQTT]");
    logger->infof("Broker: %s:%u  Client id: %s  Namespace: %s",
                  mqtt.host, mqtt.port, mqtt.clientId, mqtt.topicNamespace);
    logger->infof("Keep-alive: %u s  Connect timeout: %u ms", (unsigned)mqtt.keepAliveSec,
                  (unsigned)mqtt.connectTimeoutMs);

    logger->info("[Relay]");
    logger->infof("Channel: %u  Beacon: %lu ms  Stale: %lu ms  Pull: %lu ms", relay.channel,
                  (unsigned long)relay.beaconIntervalMs, (unsigned long)relay.staleWindowMs,
                  (unsigned long)relay.forwardRequestIntervalMs);
    for (size_t i = 0; i < relay.siblingCount; i++) {
        const RelaySibling& s = relay.siblings[i];
        logger->infof("Sibling %s (id %u) %02X:%02X:%02X:%02X:%02X:%02X", s.nodeId, s.relayId,
                      s.mac[0], s.mac[1], s.mac[2], s.mac[3], s.mac[4], s.mac[5]);
    }

    logger->info("[Failover]");
    logger->infof("Failover delay: %lu ms  Recover delay: %lu ms",
                  (unsigned long)failover.failoverDelayMs, (unsigned long)failover.recoverDelayMs);

    logger->info("[Wearable]");
    logger->infof("Name prefix: %s  Scan: %lu ms  Reconnect: %lu ms  ECG only when direct: %s",
                  wearable.namePrefix, (unsigned long)wearable.scanDurationMs,
                  (unsigned long)wearable.reconnectIntervalMs,
                  wearable.ecgOnlyWhenDirect ? "yes" : "no");

    logger->info("[ECG]");
    logger->infof("Queue: %u packets x %u B  Bundle budget: %u B every %lu ms  Rate: %u Hz",
                  (unsigned)ecg.queueCapacity, (unsigned)ecg.maxPacketBytes,
                  (unsigned)ecg.bundleBudgetBytes, (unsigned long)ecg.bundleIntervalMs,
                  ecg.sampleRateHz);

    logger->info("[Publish]");
    logger->infof("Biomedical: %lu ms  Environment: %lu ms  Health: %lu ms",
                  (unsigned long)publish.biomedicalIntervalMs,
                  (unsigned long)publish.environmentIntervalMs,
                  (unsigned long)publish.healthIntervalMs);

    logger->info("===============================================");
}

const RelaySibling* Config::findSibling(uint8_t relayId) const {
    for (size_t i = 0; i < relay.siblingCount; i++) {
        if (relay.siblings[i].relayId == relayId) return &relay.siblings[i];
    }
    return nullptr;
}

const RelaySibling* Config::findSibling(const uint8_t mac[MAC_LENGTH]) const {
    for (size_t i = 0; i < relay.siblingCount; i++) {
        if (memcmp(relay.siblings[i].mac, mac, MAC_LENGTH) == 0) return &relay.siblings[i];
    }
    return nullptr;
}
