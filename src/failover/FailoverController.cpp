#include "FailoverController.h"

FailoverController::FailoverController(ILogger* log, const Config* cfg, UplinkManager* uplinkManager,
                                       RelayLink* relayLink)
    : logger(log), config(cfg), uplink(uplinkManager), link(relayLink),
      machine(&cfg->failover), currentRelay(nullptr), handshakesSent(0), retargets(0) {
}

void FailoverController::chooseRelay(uint32_t now) {
    currentRelay = link->selectRelay(now);
    if (!currentRelay) return;

    if (link->sendRelayStart(*currentRelay)) handshakesSent++;
    if (logger) logger->infof("Relaying through %s (relay id %u)", currentRelay->nodeId,
                              (unsigned)currentRelay->relayId);
}

FailoverTransition FailoverController::tick(uint32_t now) {
    bool effective = uplink->isEffective();
    bool relayAvailable = link->hasViableRelay(now);

    FailoverTransition transition = machine.update(now, effective, relayAvailable);

    if (transition.changed) {
        if (logger) logger->warningf("Mode %s -> %s", failoverStateName(transition.from),
                                     failoverStateName(transition.to));
        if (transition.to == FailoverState::RELAYED) {
            chooseRelay(now);
        } else {
            currentRelay = nullptr;
        }
    } else if (machine.getState() == FailoverState::RELAYED &&
               (!currentRelay || !link->isViable(*currentRelay, now))) {
        const RelaySibling* previous = currentRelay;
        chooseRelay(now);
        if (currentRelay && currentRelay != previous) {
            retargets++;
            if (logger) logger->infof("Relay re-targeted to %s", currentRelay->nodeId);
        }
    }

    return transition;
}
