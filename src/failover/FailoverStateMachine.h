#ifndef FAILOVER_STATE_MACHINE_H
#define FAILOVER_STATE_MACHINE_H

#include <stdint.h>
#include "../../include/Config.h"

enum class FailoverState {
    DIRECT,
    RELAYED,
    STRANDED
};

const char* failoverStateName(FailoverState state);

struct FailoverTransition {
    bool changed;
    FailoverState from;
    FailoverState to;

    FailoverTransition(FailoverState f = FailoverState::DIRECT, FailoverState t = FailoverState::DIRECT)
        : changed(f != t), from(f), to(t) {}
};

/**
 * Pure transition function for the node's publishing mode.
 *
 *   DIRECT   -> RELAYED   uplink down for failoverDelay, viable relay present
 *   DIRECT   -> STRANDED  uplink down for failoverDelay, no viable relay
 *   RELAYED  -> STRANDED  no viable relay (immediate)
 *   STRANDED -> RELAYED   viable relay present (immediate)
 *   RELAYED/STRANDED -> DIRECT  uplink up for recoverDelay
 *
 * Dwell timers run from the start of the continuous opposing condition.
 */
class FailoverStateMachine {
private:
    const FailoverConfig* config;
    FailoverState state;

    bool downValid;
    uint32_t downSince;
    bool upValid;
    uint32_t upSince;

public:
    explicit FailoverStateMachine(const FailoverConfig* cfg);

    FailoverTransition update(uint32_t now, bool uplinkEffective, bool relayAvailable);
    void reset();

    FailoverState getState() const { return state; }
};

#endif
