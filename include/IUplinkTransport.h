#ifndef IUPLINK_TRANSPORT_H
#define IUPLINK_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>
#include "Config.h"

// Usage contract of the WiFi station + MQTT session pair. Association
// completes in the background. connectSession() is the only call allowed to
// block: at most mqtt.connectTimeoutMs for the TCP connect plus one second
// for the broker's CONNACK.
class IUplinkTransport {
public:
    virtual ~IUplinkTransport() = default;

    virtual bool initialize(const Config* config) = 0;

    virtual bool beginAssociation(const WiFiCredential& credential) = 0;
    virtual bool isAssociated() = 0;
    virtual int8_t rssi() = 0;

    virtual bool connectSession() = 0;
    virtual bool isSessionReady() = 0;
    virtual bool publish(const char* topic, const uint8_t* payload, size_t length) = 0;

    virtual void requestTimeSync() = 0;

    // Services the session keep-alive; called once per loop iteration.
    virtual void loop() = 0;
};

#endif
