#ifndef ICLOCK_H
#define ICLOCK_H

#include <stddef.h>
#include <stdint.h>

// Monotonic milliseconds drive every state machine; compare with unsigned
// subtraction so wraparound is harmless. Wall-clock time only decorates
// outgoing messages.
class IClock {
public:
    virtual ~IClock() = default;
    virtual uint32_t monotonicMs() const = 0;

    // Writes an ISO-8601 UTC timestamp ("2024-05-01T12:00:00Z").
    // Returns false if wall-clock time is not synchronized yet.
    virtual bool utcTimestamp(char* buffer, size_t length) const = 0;
};

inline bool elapsedSince(uint32_t now, uint32_t since, uint32_t interval) {
    return (uint32_t)(now - since) >= interval;
}

#endif
