#ifndef NODE_APPLICATION_H
#define NODE_APPLICATION_H

#include "../include/Config.h"
#include "../include/ILogger.h"
#include "communication/WiFiMqttTransport.h"
#include "ecg/EcgPipeline.h"
#include "failover/FailoverController.h"
#include "logging/SerialLogger.h"
#include "platform/ArduinoClock.h"
#include "platform/EspNowRadio.h"
#include "platform/NimBLEWearableTransport.h"
#include "relay/RelayLink.h"
#include "sensors/EnvironmentSensor.h"
#include "telemetry/TelemetryPublisher.h"
#include "ui/EventCardUI.h"
#include "uplink/UplinkManager.h"
#include "wearable/WearableClient.h"

enum class ApplicationState {
    INITIALIZING,
    RUNNING,
    ERROR
};

class NodeApplication {
private:
    Config config;
    SerialLogger logger;
    EventCardUI ui;
    ArduinoClock clock;

    WiFiMqttTransport uplinkTransport;
    EspNowRadio relayRadio;
    NimBLEWearableTransport wearableTransport;
    EnvironmentSensor environmentSensor;

    UplinkManager uplink;
    RelayLink relayLink;
    FailoverController failover;
    EcgPipeline pipeline;
    WearableClient wearable;
    TelemetryPublisher publisher;

    ApplicationState currentState;
    bool ecgEnabled;
    uint32_t lastStatusAt;

    char consoleLine[48];
    size_t consoleLength;

    enum LedMode { LED_OFF, LED_FAST, LED_SLOW, LED_ERROR };
    LedMode ledMode;
    uint32_t lastLedToggle;
    bool ledState;

    static constexpr uint32_t STATUS_INTERVAL_MS = 60000;

    static Config loadConfig();

    void printBootInfo();
    void printStatus(uint32_t now);
    void pollConsole();
    void handleCommand(const char* command);
    void updateEcgPolicy();

    void setLED(LedMode mode) { ledMode = mode; }
    void updateLED(uint32_t now);

public:
    NodeApplication();

    bool initialize();
    void loop();

    ApplicationState getState() const { return currentState; }
    const Config& getConfig() const { return config; }
    ILogger& getLogger() { return logger; }
    EventCardUI& getUI() { return ui; }
};

#endif
