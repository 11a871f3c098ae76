#ifndef IWEARABLE_TRANSPORT_H
#define IWEARABLE_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

// Called from the BLE host task. Implementations only copy bytes or set flags.
class IWearableEventSink {
public:
    virtual ~IWearableEventSink() = default;
    virtual void onHeartRateNotification(const uint8_t* data, size_t length) = 0;
    virtual void onPmdControlResponse(const uint8_t* data, size_t length) = 0;
    virtual void onPmdData(const uint8_t* data, size_t length) = 0;
    virtual void onWearableDisconnected() = 0;
};

// Usage contract of the BLE central stack towards one wearable strap.
// scanForDevice() is the only call allowed to block, for at most durationMs.
class IWearableTransport {
public:
    virtual ~IWearableTransport() = default;
    virtual bool initialize() = 0;
    virtual void setEventSink(IWearableEventSink* sink) = 0;

    virtual bool scanForDevice(const char* namePrefix, uint32_t durationMs) = 0;
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() = 0;
    virtual uint16_t negotiateMtu(uint16_t desired) = 0;
    virtual const char* peerName() const = 0;

    virtual bool subscribeHeartRate() = 0;
    virtual bool hasPmdService() = 0;
    virtual bool subscribePmdControl() = 0;
    virtual bool subscribePmdData() = 0;
    virtual bool writePmdControl(const uint8_t* data, size_t length) = 0;
};

#endif
