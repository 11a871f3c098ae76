#include "WearableClient.h"
#include <math.h>
#include <string.h>
#include "PmdProtocol.h"

constexpr size_t WearableClient::HR_INBOX_PACKETS;
constexpr size_t WearableClient::HR_PACKET_BYTES;
constexpr uint32_t WearableClient::SAMPLE_STALE_MS;

WearableClient::WearableClient(ILogger* log, const Config* cfg, IWearableTransport* wearableTransport,
                               PacketQueue* queue)
    : logger(log), config(cfg), transport(wearableTransport), ecgQueue(queue),
      sampleConsumer(nullptr), phase(WearablePhase::DISCONNECTED),
      heartRateInbox(HR_INBOX_PACKETS, HR_PACKET_BYTES), controlLength(0), controlPending(false),
      linkLost(false), haveSample(false), lastSampleAt(0), samplesTotal(0),
      connectAttempted(false), lastConnectAttemptAt(0), negotiatedMtu(23), ecgDesired(true),
      ecgAttempted(false), lastEcgAttemptAt(0), handshake(EcgHandshake::IDLE), handshakeSentAt(0),
      reportedSampleRate(0), connectionsTotal(0),
      handshakeFailures(0) {
    memset(controlResponse, 0, sizeof(controlResponse));
}

bool WearableClient::initialize() {
    if (!transport) {
        if (logger) logger->error("Wearable transport missing");
        return false;
    }

    transport->setEventSink(this);
    if (!transport->initialize()) {
        if (logger) logger->error("BLE stack initialization failed");
        return false;
    }

    if (logger) logger->infof("Wearable client ready, looking for \"%s*\"",
                              config->wearable.namePrefix);
    return true;
}

void WearableClient::tick(uint32_t now) {
    if (session.connected) {
        bool lost;
        {
            CriticalSection::Guard guard(section);
            lost = linkLost;
            linkLost = false;
        }
        if (lost || !transport->isConnected()) {
            handleLinkLoss(now);
        }
    }

    if (!session.connected) {
        if (!connectAttempted ||
            elapsedSince(now, lastConnectAttemptAt, config->wearable.reconnectIntervalMs)) {
            tryConnect(now);
        }
    }

    processHeartRateInbox(now);

    if (session.connected) {
        manageEcg(now);
    }
}

bool WearableClient::tryConnect(uint32_t now) {
    connectAttempted = true;
    lastConnectAttemptAt = now;

    {
        CriticalSection::Guard guard(section);
        linkLost = false;
    }

    if (!transport->scanForDevice(config->wearable.namePrefix, config->wearable.scanDurationMs)) {
        if (logger) logger->debug("No wearable found in scan window");
        return false;
    }

    if (!transport->connect()) {
        if (logger) logger->warningf("Connect to %s failed", transport->peerName());
        return false;
    }

    negotiatedMtu = transport->negotiateMtu(config->wearable.desiredMtu);

    if (!transport->subscribeHeartRate()) {
        if (logger) logger->warning("Heart rate subscription failed, dropping link");
        transport->disconnect();
        return false;
    }

    session = WearableSession();
    session.connected = true;
    session.hrReady = true;
    phase = WearablePhase::HR_ONLY;
    connectionsTotal++;

    if (transport->hasPmdService()) {
        session.pmdControlReady = transport->subscribePmdControl();
        session.pmdDataReady = transport->subscribePmdData();
        if (!session.pmdControlReady || !session.pmdDataReady) {
            if (logger) logger->warning("PMD subscription incomplete, ECG unavailable");
        }
    } else {
        if (logger) logger->info("Wearable has no PMD service, heart rate only");
    }

    // A fresh link gets an immediate ECG attempt.
    ecgAttempted = false;
    handshake = EcgHandshake::IDLE;
    clearControlMailbox();

    if (logger) logger->infof("Wearable %s connected (MTU %u)", transport->peerName(),
                              (unsigned)negotiatedMtu);
    return true;
}

void WearableClient::handleLinkLoss(uint32_t now) {
    if (logger) logger->warning("Wearable link lost");

    session = WearableSession();
    phase = WearablePhase::DISCONNECTED;
    handshake = EcgHandshake::IDLE;
    connectAttempted = true;
    lastConnectAttemptAt = now;
    clearControlMailbox();
}

void WearableClient::processHeartRateInbox(uint32_t now) {
    uint8_t packet[HR_PACKET_BYTES];
    size_t length = 0;

    while (heartRateInbox.pop(packet, sizeof(packet), length)) {
        HeartSample sample;
        if (!HeartRateParser::parse(packet, length, sample)) {
            if (logger) logger->debugf("Malformed heart rate notification (%u B)", (unsigned)length);
            continue;
        }

        latestSample = sample;
        haveSample = true;
        lastSampleAt = now;
        samplesTotal++;

        if (sampleConsumer) sampleConsumer->onHeartSample(sample);
    }
}

void WearableClient::manageEcg(uint32_t now) {
    if (handshake != EcgHandshake::IDLE) {
        if (ecgDesired) {
            advanceHandshake(now);
            return;
        }
        if (handshake == EcgHandshake::START_SENT) stopEcgStream();
        handshake = EcgHandshake::IDLE;
        if (logger) logger->info("ECG start abandoned");
        return;
    }

    bool capable = session.pmdControlReady && session.pmdDataReady;

    if (ecgDesired && capable && !session.ecgStreamingEnabled) {
        if (!ecgAttempted || elapsedSince(now, lastEcgAttemptAt, config->wearable.ecgRetryIntervalMs)) {
            ecgAttempted = true;
            lastEcgAttemptAt = now;
            beginEcgStart(now);
        }
    } else if (!ecgDesired && session.ecgStreamingEnabled) {
        stopEcgStream();
    }
}

void WearableClient::beginEcgStart(uint32_t now) {
    uint8_t command[PmdProtocol::MAX_COMMAND_BYTES];
    size_t length = PmdProtocol::buildGetSettings(command, sizeof(command));
    if (!sendControl(now, command, length, EcgHandshake::SETTINGS_SENT)) {
        failHandshake();
        return;
    }

    // A response may already be waiting.
    advanceHandshake(now);
}

void WearableClient::advanceHandshake(uint32_t now) {
    uint8_t response[sizeof(controlResponse)];
    size_t length = 0;

    while (handshake != EcgHandshake::IDLE && takeControlResponse(response, length)) {
        bool ok = handshake == EcgHandshake::SETTINGS_SENT ?
                  onSettingsResponse(now, response, length) : onStartResponse(response, length);
        if (!ok) {
            failHandshake();
            return;
        }
    }

    if (handshake != EcgHandshake::IDLE &&
        elapsedSince(now, handshakeSentAt, config->wearable.handshakeTimeoutMs)) {
        if (logger) logger->warningf("PMD control response timed out (%s)",
                                     handshake == EcgHandshake::SETTINGS_SENT ? "settings" : "start");
        failHandshake();
    }
}

bool WearableClient::onSettingsResponse(uint32_t now, const uint8_t* response, size_t length) {
    if (!accepted(response, length, PmdProtocol::OP_GET_SETTINGS, logger)) return false;

    uint16_t hz = 0;
    if (PmdProtocol::findSampleRate(response, length, hz)) {
        reportedSampleRate = hz;
    }

    uint8_t command[PmdProtocol::MAX_COMMAND_BYTES];
    size_t commandLength = PmdProtocol::buildStart(response, length, command, sizeof(command));
    if (commandLength == 0) {
        if (logger) logger->warning("ECG settings response unusable for start command");
        return false;
    }

    return sendControl(now, command, commandLength, EcgHandshake::START_SENT);
}

bool WearableClient::onStartResponse(const uint8_t* response, size_t length) {
    if (!accepted(response, length, PmdProtocol::OP_START, logger)) return false;

    handshake = EcgHandshake::IDLE;
    session.ecgStreamingEnabled = true;
    phase = WearablePhase::ECG_STREAMING;
    if (logger) logger->infof("ECG streaming at %u Hz", (unsigned)(reportedSampleRate ?
                              reportedSampleRate : config->ecg.sampleRateHz));
    return true;
}

void WearableClient::failHandshake() {
    handshake = EcgHandshake::IDLE;
    handshakeFailures++;
    clearControlMailbox();
}

void WearableClient::stopEcgStream() {
    uint8_t command[PmdProtocol::MAX_COMMAND_BYTES];
    size_t length = PmdProtocol::buildStop(command, sizeof(command));

    if (!transport->writePmdControl(command, length)) {
        if (logger) logger->warning("ECG stop command write failed");
    }

    session.ecgStreamingEnabled = false;
    phase = session.connected ? WearablePhase::HR_ONLY : WearablePhase::DISCONNECTED;
    if (logger) logger->info("ECG streaming stopped");
}

bool WearableClient::sendControl(uint32_t now, const uint8_t* command, size_t length,
                                 EcgHandshake next) {
    clearControlMailbox();

    // Set before writing: an indication can arrive before the write returns.
    handshake = next;
    handshakeSentAt = now;

    if (!transport->writePmdControl(command, length)) {
        if (logger) logger->warningf("PMD control write (op 0x%02X) failed", (unsigned)command[0]);
        return false;
    }
    return true;
}

bool WearableClient::accepted(const uint8_t* response, size_t length, uint8_t opcode,
                              ILogger* log) {
    uint8_t status = 0xFF;
    if (!PmdProtocol::readStatus(response, length, opcode, status)) {
        if (log) log->warningf("PMD control response (op 0x%02X) malformed", (unsigned)opcode);
        return false;
    }

    if (status != PmdProtocol::STATUS_SUCCESS) {
        if (log) log->warningf("PMD op 0x%02X rejected with status %u", (unsigned)opcode, (unsigned)status);
        return false;
    }

    return true;
}

bool WearableClient::takeControlResponse(uint8_t* response, size_t& responseLength) {
    CriticalSection::Guard guard(section);
    if (!controlPending) return false;
    memcpy(response, controlResponse, controlLength);
    responseLength = controlLength;
    controlPending = false;
    return true;
}

void WearableClient::clearControlMailbox() {
    CriticalSection::Guard guard(section);
    controlPending = false;
    controlLength = 0;
}

bool WearableClient::isWearableOk(uint32_t now) const {
    return session.hrReady && haveSample && !elapsedSince(now, lastSampleAt, SAMPLE_STALE_MS);
}

float WearableClient::getLatestRrMs() const {
    if (!haveSample || latestSample.rrCount == 0) return NAN;
    return latestSample.rrIntervalsMs[latestSample.rrCount - 1];
}

void WearableClient::onHeartRateNotification(const uint8_t* data, size_t length) {
    heartRateInbox.push(data, length);
}

void WearableClient::onPmdControlResponse(const uint8_t* data, size_t length) {
    if (!data || length == 0) return;

    CriticalSection::Guard guard(section);
    controlLength = length < sizeof(controlResponse) ? length : sizeof(controlResponse);
    memcpy(controlResponse, data, controlLength);
    controlPending = true;
}

void WearableClient::onPmdData(const uint8_t* data, size_t length) {
    if (ecgQueue) ecgQueue->push(data, length);
}

void WearableClient::onWearableDisconnected() {
    CriticalSection::Guard guard(section);
    linkLost = true;
}
