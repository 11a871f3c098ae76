#include "WiFiMqttTransport.h"

WiFiMqttTransport::WiFiMqttTransport(ILogger* log)
    : logger(log), config(nullptr), mqttClient(wifiClient) {
    clientId[0] = '\0';
}

bool WiFiMqttTransport::initialize(const Config* cfg) {
    config = cfg;

    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(false);
    WiFi.persistent(false);

    if (config->mqtt.clientId[0] != '\0') {
        copyField(clientId, sizeof(clientId), config->mqtt.clientId);
    } else {
        snprintf(clientId, sizeof(clientId), "%s-%s", config->publish.sourceTag,
                 config->identity.nodeId);
    }

    mqttClient.setServer(config->mqtt.host, config->mqtt.port);
    mqttClient.setKeepAlive(config->mqtt.keepAliveSec);
    mqttClient.setSocketTimeout(CONNACK_TIMEOUT_SEC);
    if (!mqttClient.setBufferSize(config->ecg.bundleBudgetBytes + PACKET_OVERHEAD)) {
        if (logger) logger->error("MQTT buffer allocation failed");
        return false;
    }

    if (logger) logger->infof("MQTT client id %s, broker %s:%u", clientId, config->mqtt.host,
                              (unsigned)config->mqtt.port);
    return true;
}

bool WiFiMqttTransport::beginAssociation(const WiFiCredential& credential) {
    WiFi.disconnect(false);
    // Keep the relay radio on its channel while associated.
    wl_status_t status = WiFi.begin(credential.ssid, credential.password, config->relay.channel);
    return status != WL_CONNECT_FAILED;
}

bool WiFiMqttTransport::isAssociated() {
    return WiFi.status() == WL_CONNECTED;
}

int8_t WiFiMqttTransport::rssi() {
    return isAssociated() ? (int8_t)WiFi.RSSI() : 0;
}

bool WiFiMqttTransport::connectSession() {
    if (!isAssociated()) return false;

    const char* user = config->mqtt.username[0] ? config->mqtt.username : nullptr;
    const char* pass = config->mqtt.password[0] ? config->mqtt.password : nullptr;

    // PubSubClient::connect() keeps an open socket; only CONNACK waits there.
    if (!wifiClient.connected() &&
        !wifiClient.connect(config->mqtt.host, config->mqtt.port,
                            (int32_t)config->mqtt.connectTimeoutMs)) {
        if (logger) logger->warningf("Broker %s:%u unreachable", config->mqtt.host,
                                     (unsigned)config->mqtt.port);
        return false;
    }

    if (mqttClient.connect(clientId, user, pass)) {
        return true;
    }

    wifiClient.stop();

    if (logger) logger->warningf("MQTT connect failed, state %d", mqttClient.state());
    return false;
}

bool WiFiMqttTransport::isSessionReady() {
    return mqttClient.connected();
}

bool WiFiMqttTransport::publish(const char* topic, const uint8_t* payload, size_t length) {
    return mqttClient.publish(topic, payload, (unsigned int)length, false);
}

void WiFiMqttTransport::requestTimeSync() {
    configTime(0, 0, "pool.ntp.org", "time.nist.gov");
    if (logger) logger->info("NTP sync requested");
}

void WiFiMqttTransport::loop() {
    mqttClient.loop();
}
