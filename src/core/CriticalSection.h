#ifndef CRITICAL_SECTION_H
#define CRITICAL_SECTION_H

#include <mutex>

/**
 * CriticalSection - the only synchronization between radio callbacks
 * (BLE host task, ESP-NOW receive) and the cooperative loop.
 *
 * Hold it for a copy or a counter update, never across I/O.
 *
 * Usage:
 *   {
 *     CriticalSection::Guard guard(section);
 *     latestBpm = bpm;
 *   }
 */
class CriticalSection {
public:
    CriticalSection() = default;
    CriticalSection(const CriticalSection&) = delete;
    CriticalSection& operator=(const CriticalSection&) = delete;

    class Guard {
    public:
        explicit Guard(CriticalSection& section) : lock(section.mutex) {}
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        std::lock_guard<std::mutex> lock;
    };

private:
    std::mutex mutex;
};

#endif
