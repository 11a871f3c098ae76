#include "FailoverStateMachine.h"
#include "../../include/IClock.h"

const char* failoverStateName(FailoverState state) {
    switch (state) {
        case FailoverState::DIRECT: return "DIRECT";
        case FailoverState::RELAYED: return "RELAYED";
        case FailoverState::STRANDED: return "STRANDED";
    }
    return "UNKNOWN";
}

FailoverStateMachine::FailoverStateMachine(const FailoverConfig* cfg)
    : config(cfg), state(FailoverState::DIRECT), downValid(false), downSince(0),
      upValid(false), upSince(0) {
}

void FailoverStateMachine::reset() {
    state = FailoverState::DIRECT;
    downValid = false;
    upValid = false;
}

FailoverTransition FailoverStateMachine::update(uint32_t now, bool uplinkEffective,
                                                bool relayAvailable) {
    if (uplinkEffective) {
        downValid = false;
        if (!upValid) {
            upValid = true;
            upSince = now;
        }
    } else {
        upValid = false;
        if (!downValid) {
            downValid = true;
            downSince = now;
        }
    }

    bool downLongEnough = downValid && elapsedSince(now, downSince, config->failoverDelayMs);
    bool upLongEnough = upValid && elapsedSince(now, upSince, config->recoverDelayMs);

    FailoverState next = state;
    switch (state) {
        case FailoverState::DIRECT:
            if (downLongEnough) {
                next = relayAvailable ? FailoverState::RELAYED : FailoverState::STRANDED;
            }
            break;

        case FailoverState::RELAYED:
            if (upLongEnough) {
                next = FailoverState::DIRECT;
            } else if (!relayAvailable) {
                next = FailoverState::STRANDED;
            }
            break;

        case FailoverState::STRANDED:
            if (upLongEnough) {
                next = FailoverState::DIRECT;
            } else if (relayAvailable) {
                next = FailoverState::RELAYED;
            }
            break;
    }

    FailoverTransition transition(state, next);
    state = next;
    return transition;
}
