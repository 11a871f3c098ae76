#ifndef WEARABLE_CLIENT_H
#define WEARABLE_CLIENT_H

#include "../../include/Config.h"
#include "../../include/IClock.h"
#include "../../include/ILogger.h"
#include "../../include/IWearableTransport.h"
#include "../core/CriticalSection.h"
#include "../core/PacketQueue.h"
#include "HeartRateParser.h"

enum class WearablePhase {
    DISCONNECTED,
    HR_ONLY,
    ECG_STREAMING
};

// ECG start exchange in flight. Each step waits for its control response
// on later ticks until handshakeTimeoutMs has passed.
enum class EcgHandshake {
    IDLE,
    SETTINGS_SENT,
    START_SENT
};

// Exists while connected; every flag drops on link loss.
struct WearableSession {
    bool connected;
    bool hrReady;
    bool pmdControlReady;
    bool pmdDataReady;
    bool ecgStreamingEnabled;

    WearableSession()
        : connected(false), hrReady(false), pmdControlReady(false),
          pmdDataReady(false), ecgStreamingEnabled(false) {}
};

class IHeartSampleConsumer {
public:
    virtual ~IHeartSampleConsumer() = default;
    virtual void onHeartSample(const HeartSample& sample) = 0;
};

class WearableClient : public IWearableEventSink {
private:
    ILogger* logger;
    const Config* config;
    IWearableTransport* transport;
    PacketQueue* ecgQueue;
    IHeartSampleConsumer* sampleConsumer;

    WearablePhase phase;
    WearableSession session;

    // Callback touch-points
    CriticalSection section;
    PacketQueue heartRateInbox;
    uint8_t controlResponse[64];
    size_t controlLength;
    bool controlPending;
    bool linkLost;

    HeartSample latestSample;
    bool haveSample;
    uint32_t lastSampleAt;
    uint32_t samplesTotal;

    bool connectAttempted;
    uint32_t lastConnectAttemptAt;
    uint16_t negotiatedMtu;

    bool ecgDesired;
    bool ecgAttempted;
    uint32_t lastEcgAttemptAt;
    EcgHandshake handshake;
    uint32_t handshakeSentAt;
    uint16_t reportedSampleRate;

    uint32_t connectionsTotal;
    uint32_t handshakeFailures;

    static constexpr size_t HR_INBOX_PACKETS = 8;
    static constexpr size_t HR_PACKET_BYTES = 32;
    static constexpr uint32_t SAMPLE_STALE_MS = 5000;

    bool tryConnect(uint32_t now);
    void handleLinkLoss(uint32_t now);
    void processHeartRateInbox(uint32_t now);
    void manageEcg(uint32_t now);
    void beginEcgStart(uint32_t now);
    void advanceHandshake(uint32_t now);
    bool onSettingsResponse(uint32_t now, const uint8_t* response, size_t length);
    bool onStartResponse(const uint8_t* response, size_t length);
    void failHandshake();
    void stopEcgStream();
    void clearControlMailbox();
    bool takeControlResponse(uint8_t* response, size_t& responseLength);
    bool sendControl(uint32_t now, const uint8_t* command, size_t length, EcgHandshake next);
    static bool accepted(const uint8_t* response, size_t length, uint8_t opcode, ILogger* log);

public:
    WearableClient(ILogger* log, const Config* cfg, IWearableTransport* transport,
                   PacketQueue* ecgQueue);

    bool initialize();
    void tick(uint32_t now);

    void setHeartSampleConsumer(IHeartSampleConsumer* consumer) { sampleConsumer = consumer; }

    // ECG can be toggled at any time; takes effect on the next tick.
    void setEcgDesired(bool desired) { ecgDesired = desired; }
    bool isEcgDesired() const { return ecgDesired; }

    WearablePhase getPhase() const { return phase; }
    const WearableSession& getSession() const { return session; }
    bool isConnected() const { return session.connected; }
    bool isEcgStreaming() const { return session.ecgStreamingEnabled; }
    EcgHandshake getHandshake() const { return handshake; }
    bool isWearableOk(uint32_t now) const;

    bool hasSample() const { return haveSample; }
    const HeartSample& getLatestSample() const { return latestSample; }
    float getLatestRrMs() const;
    uint32_t getSamplesTotal() const { return samplesTotal; }
    uint16_t getReportedSampleRate() const { return reportedSampleRate; }
    uint16_t getNegotiatedMtu() const { return negotiatedMtu; }
    uint32_t getConnectionsTotal() const { return connectionsTotal; }
    uint32_t getHandshakeFailures() const { return handshakeFailures; }

    void onHeartRateNotification(const uint8_t* data, size_t length) override;
    void onPmdControlResponse(const uint8_t* data, size_t length) override;
    void onPmdData(const uint8_t* data, size_t length) override;
    void onWearableDisconnected() override;
};

#endif
