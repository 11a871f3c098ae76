#ifndef RELAY_LINK_H
#define RELAY_LINK_H

#include "../../include/Config.h"
#include "../../include/IClock.h"
#include "../../include/ILogger.h"
#include "../../include/IRelayRadio.h"
#include "../core/PacketQueue.h"
#include "RelayProtocol.h"

// Last beacon heard from one configured sibling.
struct RelayPeer {
    bool heard;
    uint32_t lastBeaconAt;
    bool peerUplinkOk;
    int8_t rssi;

    RelayPeer() : heard(false), lastBeaconAt(0), peerUplinkOk(false), rssi(0) {}
};

// Supplies the node's own snapshot when a sibling asks for one.
class ICapsuleSource {
public:
    virtual ~ICapsuleSource() = default;
    virtual bool buildCapsule(Capsule& capsule) = 0;
};

// Receives capsules from siblings while this node is the gateway.
class ICapsuleSink {
public:
    virtual ~ICapsuleSink() = default;
    virtual bool onSiblingCapsule(const RelaySibling& sibling, const Capsule& capsule) = 0;
};

class RelayLink : public IRelayFrameSink {
private:
    ILogger* logger;
    const Config* config;
    IRelayRadio* radio;
    ICapsuleSource* capsuleSource;
    ICapsuleSink* capsuleSink;

    RelayPeer peers[MAX_RELAY_SIBLINGS];
    PacketQueue inbox;

    bool beaconSent;
    uint32_t lastBeaconAt;
    bool forwardRequestSent;
    uint32_t lastForwardRequestAt;
    uint16_t capsuleSeq;

    uint32_t framesReceived;
    uint32_t framesRejected;
    uint32_t capsulesSent;
    uint32_t capsulesAnswered;
    uint32_t capsulesForwarded;
    uint32_t capsulesDropped;

    static constexpr size_t INBOX_FRAMES = 16;

    int siblingIndex(const uint8_t* mac) const;
    void processInbox(uint32_t now, bool direct);
    void handleFrame(uint32_t now, bool direct, int index, const uint8_t* data, size_t length);
    bool sendTo(const RelaySibling& sibling, const uint8_t* frame, size_t length);
    void broadcast(const uint8_t* frame, size_t length);

public:
    RelayLink(ILogger* log, const Config* cfg, IRelayRadio* radio);

    bool initialize();

    // direct: this node currently publishes through its own uplink.
    void tick(uint32_t now, bool direct, bool uplinkEffective, int8_t uplinkRssi);

    void setCapsuleSource(ICapsuleSource* source) { capsuleSource = source; }
    void setCapsuleSink(ICapsuleSink* sink) { capsuleSink = sink; }

    // Viable = beacon fresher than the stale window and reporting uplink OK.
    bool isViable(const RelaySibling& sibling, uint32_t now) const;
    bool hasViableRelay(uint32_t now) const;
    size_t viablePeerCount(uint32_t now) const;

    // Strongest reported signal among viable siblings, nullptr if none.
    const RelaySibling* selectRelay(uint32_t now) const;

    bool sendRelayStart(const RelaySibling& sibling);
    bool sendCapsule(const RelaySibling& sibling, Capsule& capsule);

    const RelayPeer* getPeer(const RelaySibling& sibling) const;
    uint32_t getFramesReceived() const { return framesReceived; }
    uint32_t getFramesRejected() const { return framesRejected; }
    uint32_t getCapsulesSent() const { return capsulesSent; }
    uint32_t getCapsulesAnswered() const { return capsulesAnswered; }
    uint32_t getCapsulesForwarded() const { return capsulesForwarded; }
    uint32_t getCapsulesDropped() const { return capsulesDropped; }

    void onRelayFrame(const uint8_t* mac, const uint8_t* data, size_t length) override;
};

#endif
