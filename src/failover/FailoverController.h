#ifndef FAILOVER_CONTROLLER_H
#define FAILOVER_CONTROLLER_H

#include "../../include/Config.h"
#include "../../include/ILogger.h"
#include "../relay/RelayLink.h"
#include "../uplink/UplinkManager.h"
#include "FailoverStateMachine.h"

// Feeds the state machine from the uplink and relay link, and performs
// the relay handshake whenever a (new) relay is chosen.
class FailoverController {
private:
    ILogger* logger;
    const Config* config;
    UplinkManager* uplink;
    RelayLink* link;
    FailoverStateMachine machine;

    const RelaySibling* currentRelay;
    uint32_t handshakesSent;
    uint32_t retargets;

    void chooseRelay(uint32_t now);

public:
    FailoverController(ILogger* log, const Config* cfg, UplinkManager* uplink, RelayLink* link);

    FailoverTransition tick(uint32_t now);

    FailoverState getState() const { return machine.getState(); }
    bool isDirect() const { return machine.getState() == FailoverState::DIRECT; }
    const RelaySibling* getCurrentRelay() const { return currentRelay; }
    uint32_t getHandshakesSent() const { return handshakesSent; }
    uint32_t getRetargets() const { return retargets; }
};

#endif
