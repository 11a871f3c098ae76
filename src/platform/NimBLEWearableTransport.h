#ifndef NIMBLE_WEARABLE_TRANSPORT_H
#define NIMBLE_WEARABLE_TRANSPORT_H

#include <NimBLEDevice.h>
#include "../../include/ILogger.h"
#include "../../include/IWearableTransport.h"

// BLE central towards one chest strap (NimBLE-Arduino 1.4 API).
class NimBLEWearableTransport : public IWearableTransport, public NimBLEClientCallbacks {
private:
    ILogger* logger;
    IWearableEventSink* sink;

    NimBLEClient* client;
    NimBLEAddress peerAddress;
    bool peerFound;
    char name[32];

    NimBLERemoteCharacteristic* heartRateChar;
    NimBLERemoteCharacteristic* pmdControlChar;
    NimBLERemoteCharacteristic* pmdDataChar;

    static const NimBLEUUID HEART_RATE_SERVICE;
    static const NimBLEUUID HEART_RATE_MEASUREMENT;
    static const NimBLEUUID PMD_SERVICE;
    static const NimBLEUUID PMD_CONTROL;
    static const NimBLEUUID PMD_DATA;

    void releaseCharacteristics();

public:
    explicit NimBLEWearableTransport(ILogger* log);

    bool initialize() override;
    void setEventSink(IWearableEventSink* eventSink) override { sink = eventSink; }

    bool scanForDevice(const char* namePrefix, uint32_t durationMs) override;
    bool connect() override;
    void disconnect() override;
    bool isConnected() override;
    uint16_t negotiateMtu(uint16_t desired) override;
    const char* peerName() const override { return name; }

    bool subscribeHeartRate() override;
    bool hasPmdService() override;
    bool subscribePmdControl() override;
    bool subscribePmdData() override;
    bool writePmdControl(const uint8_t* data, size_t length) override;

    void onDisconnect(NimBLEClient* pClient) override;
};

#endif
