#include "RelayLink.h"
#include <string.h>

constexpr size_t RelayLink::INBOX_FRAMES;

RelayLink::RelayLink(ILogger* log, const Config* cfg, IRelayRadio* relayRadio)
    : logger(log), config(cfg), radio(relayRadio), capsuleSource(nullptr), capsuleSink(nullptr),
      inbox(INBOX_FRAMES, MAC_LENGTH + RelayProtocol::MAX_FRAME_BYTES), beaconSent(false),
      lastBeaconAt(0), forwardRequestSent(false), lastForwardRequestAt(0), capsuleSeq(0),
      framesReceived(0), framesRejected(0), capsulesSent(0), capsulesAnswered(0),
      capsulesForwarded(0), capsulesDropped(0) {
}

bool RelayLink::initialize() {
    if (!radio) {
        if (logger) logger->error("Relay radio missing");
        return false;
    }

    if (!radio->begin(config->relay.channel)) {
        if (logger) logger->errorf("Relay radio failed to start on channel %u",
                                   (unsigned)config->relay.channel);
        return false;
    }

    for (size_t i = 0; i < config->relay.siblingCount; i++) {
        const RelaySibling& sibling = config->relay.siblings[i];
        if (!radio->addPeer(sibling.mac)) {
            if (logger) logger->errorf("Relay peer %s could not be registered", sibling.nodeId);
            return false;
        }
    }

    radio->setReceiver(this);

    if (logger) logger->infof("Relay link on channel %u with %u sibling(s)",
                              (unsigned)config->relay.channel,
                              (unsigned)config->relay.siblingCount);
    return true;
}

void RelayLink::onRelayFrame(const uint8_t* mac, const uint8_t* data, size_t length) {
    if (!mac || !data || length == 0 || length > RelayProtocol::MAX_FRAME_BYTES) return;

    uint8_t entry[MAC_LENGTH + RelayProtocol::MAX_FRAME_BYTES];
    memcpy(entry, mac, MAC_LENGTH);
    memcpy(&entry[MAC_LENGTH], data, length);
    inbox.push(entry, MAC_LENGTH + length);
}

int RelayLink::siblingIndex(const uint8_t* mac) const {
    for (size_t i = 0; i < config->relay.siblingCount; i++) {
        if (memcmp(config->relay.siblings[i].mac, mac, MAC_LENGTH) == 0) return (int)i;
    }
    return -1;
}

void RelayLink::tick(uint32_t now, bool direct, bool uplinkEffective, int8_t uplinkRssi) {
    processInbox(now, direct);

    if (config->relay.siblingCount == 0) return;

    if (!beaconSent || elapsedSince(now, lastBeaconAt, config->relay.beaconIntervalMs)) {
        beaconSent = true;
        lastBeaconAt = now;

        uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
        Beacon beacon(config->identity.relayId, uplinkEffective, uplinkRssi);
        size_t length = RelayProtocol::encodeBeacon(beacon, frame, sizeof(frame));
        broadcast(frame, length);
    }

    if (direct && config->relay.forwardRequestIntervalMs > 0 &&
        (!forwardRequestSent ||
         elapsedSince(now, lastForwardRequestAt, config->relay.forwardRequestIntervalMs))) {
        forwardRequestSent = true;
        lastForwardRequestAt = now;

        uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
        size_t length = RelayProtocol::encodeForwardRequest(config->identity.relayId, frame,
                                                            sizeof(frame));
        broadcast(frame, length);
    }
}

void RelayLink::processInbox(uint32_t now, bool direct) {
    uint8_t entry[MAC_LENGTH + RelayProtocol::MAX_FRAME_BYTES];
    size_t length = 0;

    while (inbox.pop(entry, sizeof(entry), length)) {
        framesReceived++;

        int index = siblingIndex(entry);
        if (index < 0) {
            framesRejected++;
            if (logger) logger->debugf("Relay frame from unknown %02X:%02X:%02X:%02X:%02X:%02X",
                                       entry[0], entry[1], entry[2], entry[3], entry[4], entry[5]);
            continue;
        }

        handleFrame(now, direct, index, &entry[MAC_LENGTH], length - MAC_LENGTH);
    }
}

void RelayLink::handleFrame(uint32_t now, bool direct, int index, const uint8_t* data,
                            size_t length) {
    const RelaySibling& sibling = config->relay.siblings[index];
    RelayFrameType type;
    const uint8_t* payload = nullptr;
    size_t payloadLength = 0;

    if (!RelayProtocol::readHeader(data, length, type, payload, payloadLength)) {
        framesRejected++;
        if (logger) logger->debugf("Invalid relay frame (%u B) from %s", (unsigned)length,
                                   sibling.nodeId);
        return;
    }

    switch (type) {
        case RelayFrameType::BEACON: {
            Beacon beacon;
            if (!RelayProtocol::decodeBeacon(payload, payloadLength, beacon)) break;
            RelayPeer& peer = peers[index];
            peer.heard = true;
            peer.lastBeaconAt = now;
            peer.peerUplinkOk = beacon.uplinkOk;
            peer.rssi = beacon.rssi;
            break;
        }

        case RelayFrameType::FORWARD_REQUEST: {
            if (direct || !capsuleSource) break;
            Capsule capsule;
            if (!capsuleSource->buildCapsule(capsule)) break;
            if (sendCapsule(sibling, capsule)) capsulesAnswered++;
            break;
        }

        case RelayFrameType::CAPSULE: {
            Capsule capsule;
            if (!RelayProtocol::decodeCapsule(payload, payloadLength, capsule)) break;
            if (!direct || !capsuleSink) {
                capsulesDropped++;
                if (logger) logger->debugf("Capsule #%u from %s dropped, not a gateway",
                                           (unsigned)capsule.seq, sibling.nodeId);
                break;
            }
            if (capsuleSink->onSiblingCapsule(sibling, capsule)) capsulesForwarded++;
            break;
        }

        case RelayFrameType::RELAY_START: {
            uint8_t fromId = 0;
            if (!RelayProtocol::decodeId(payload, payloadLength, fromId)) break;
            if (logger) logger->infof("%s (relay id %u) now relays through this node",
                                      sibling.nodeId, (unsigned)fromId);
            break;
        }
    }
}

bool RelayLink::sendTo(const RelaySibling& sibling, const uint8_t* frame, size_t length) {
    if (length == 0) return false;
    return radio->send(sibling.mac, frame, length);
}

void RelayLink::broadcast(const uint8_t* frame, size_t length) {
    for (size_t i = 0; i < config->relay.siblingCount; i++) {
        sendTo(config->relay.siblings[i], frame, length);
    }
}

bool RelayLink::isViable(const RelaySibling& sibling, uint32_t now) const {
    const RelayPeer* peer = getPeer(sibling);
    if (!peer || !peer->heard || !peer->peerUplinkOk) return false;
    return !elapsedSince(now, peer->lastBeaconAt, config->relay.staleWindowMs);
}

bool RelayLink::hasViableRelay(uint32_t now) const {
    return selectRelay(now) != nullptr;
}

size_t RelayLink::viablePeerCount(uint32_t now) const {
    size_t count = 0;
    for (size_t i = 0; i < config->relay.siblingCount; i++) {
        if (isViable(config->relay.siblings[i], now)) count++;
    }
    return count;
}

const RelaySibling* RelayLink::selectRelay(uint32_t now) const {
    const RelaySibling* best = nullptr;
    int8_t bestRssi = INT8_MIN;

    for (size_t i = 0; i < config->relay.siblingCount; i++) {
        const RelaySibling& sibling = config->relay.siblings[i];
        if (!isViable(sibling, now)) continue;
        if (!best || peers[i].rssi > bestRssi) {
            best = &sibling;
            bestRssi = peers[i].rssi;
        }
    }

    return best;
}

bool RelayLink::sendRelayStart(const RelaySibling& sibling) {
    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeRelayStart(config->identity.relayId, frame, sizeof(frame));
    if (!sendTo(sibling, frame, length)) {
        if (logger) logger->warningf("Relay start to %s not sent", sibling.nodeId);
        return false;
    }
    return true;
}

bool RelayLink::sendCapsule(const RelaySibling& sibling, Capsule& capsule) {
    capsule.sourceId = config->identity.relayId;
    capsule.seq = capsuleSeq++;

    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeCapsule(capsule, frame, sizeof(frame));
    if (!sendTo(sibling, frame, length)) {
        if (logger) logger->debugf("Capsule #%u to %s not sent", (unsigned)capsule.seq,
                                   sibling.nodeId);
        return false;
    }

    capsulesSent++;
    return true;
}

const RelayPeer* RelayLink::getPeer(const RelaySibling& sibling) const {
    int index = siblingIndex(sibling.mac);
    return index < 0 ? nullptr : &peers[index];
}
