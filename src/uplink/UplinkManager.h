#ifndef UPLINK_MANAGER_H
#define UPLINK_MANAGER_H

#include "../../include/Config.h"
#include "../../include/IClock.h"
#include "../../include/ILogger.h"
#include "../../include/IUplinkTransport.h"

enum class LinkState {
    IDLE,
    ASSOCIATING,
    ASSOCIATED,
    READY
};

const char* linkStateName(LinkState state);

/**
 * Keeps the node on the infrastructure network and the broker session up.
 *
 * tick() never blocks: an association attempt gets attemptTimeoutMs to
 * complete before the next credential in the list is tried, and the
 * session is only (re)connected after association, every sessionRetryMs.
 */
class UplinkManager {
private:
    ILogger* logger;
    const Config* config;
    IUplinkTransport* transport;

    LinkState state;
    size_t credentialIndex;
    uint32_t attemptStartedAt;
    bool sessionAttempted;
    uint32_t lastSessionAttemptAt;
    bool timeSyncRequested;
    bool forcedDown;

    uint32_t associationAttempts;
    uint32_t sessionAttempts;
    uint32_t publishedTotal;
    uint32_t publishFailures;

    void beginAttempt(uint32_t now);
    void setState(LinkState next);
    void trySession(uint32_t now);

public:
    UplinkManager(ILogger* log, const Config* cfg, IUplinkTransport* transport);

    bool initialize();
    void tick(uint32_t now);

    // Physical state: associated and session ready.
    bool isReal() const { return state == LinkState::READY; }
    // What the failover machine sees.
    bool isEffective() const { return isReal() && !forcedDown; }

    void setForcedDown(bool down);
    bool isForcedDown() const { return forcedDown; }

    // Fire-and-forget; false when the uplink is not effective or the
    // session refused the message.
    bool publish(const char* topic, const uint8_t* payload, size_t length);
    bool publish(const char* topic, const char* json);

    LinkState getState() const { return state; }
    size_t getCredentialIndex() const { return credentialIndex; }
    const char* getCurrentSsid() const;
    int8_t getRssi() const;
    uint32_t getAssociationAttempts() const { return associationAttempts; }
    uint32_t getSessionAttempts() const { return sessionAttempts; }
    uint32_t getPublishedTotal() const { return publishedTotal; }
    uint32_t getPublishFailures() const { return publishFailures; }
};

#endif
