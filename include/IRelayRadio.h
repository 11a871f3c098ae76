#ifndef IRELAY_RADIO_H
#define IRELAY_RADIO_H

#include <stddef.h>
#include <stdint.h>

// Called from the radio receive task; implementations only copy bytes.
class IRelayFrameSink {
public:
    virtual ~IRelayFrameSink() = default;
    virtual void onRelayFrame(const uint8_t* mac, const uint8_t* data, size_t length) = 0;
};

// Connectionless, fixed-channel, point-to-point radio between sibling nodes.
class IRelayRadio {
public:
    virtual ~IRelayRadio() = default;
    virtual bool begin(uint8_t channel) = 0;
    virtual bool addPeer(const uint8_t* mac) = 0;
    virtual bool send(const uint8_t* mac, const uint8_t* data, size_t length) = 0;
    virtual void setReceiver(IRelayFrameSink* sink) = 0;
};

#endif
