#ifndef WIFI_MQTT_TRANSPORT_H
#define WIFI_MQTT_TRANSPORT_H

#include <PubSubClient.h>
#include <WiFi.h>
#include "../../include/Config.h"
#include "../../include/ILogger.h"
#include "../../include/IUplinkTransport.h"

// WiFi station + plain MQTT session. Association runs in the WiFi driver;
// nothing here waits for it.
class WiFiMqttTransport : public IUplinkTransport {
private:
    ILogger* logger;
    const Config* config;

    WiFiClient wifiClient;
    PubSubClient mqttClient;
    char clientId[48];

    static constexpr size_t PACKET_OVERHEAD = 128;
    static constexpr uint16_t CONNACK_TIMEOUT_SEC = 1;

public:
    explicit WiFiMqttTransport(ILogger* log);

    bool initialize(const Config* cfg) override;

    bool beginAssociation(const WiFiCredential& credential) override;
    bool isAssociated() override;
    int8_t rssi() override;

    bool connectSession() override;
    bool isSessionReady() override;
    bool publish(const char* topic, const uint8_t* payload, size_t length) override;

    void requestTimeSync() override;
    void loop() override;
};

#endif
