#ifndef PACKET_QUEUE_H
#define PACKET_QUEUE_H

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "CriticalSection.h"

// Bounded FIFO of opaque radio packets shared between one callback
// producer and the loop consumer. A full queue evicts its oldest packet;
// push never blocks and never allocates.
class PacketQueue {
private:
    size_t capacity;
    size_t slotBytes;
    std::vector<uint8_t> storage;
    std::vector<uint16_t> lengths;

    size_t head;
    size_t count;

    uint32_t pushedTotal;
    uint32_t droppedTotal;
    uint32_t rejectedTotal;

    mutable CriticalSection section;

public:
    PacketQueue(size_t capacity, size_t maxPacketBytes);

    // Rejects (and counts) empty or oversize packets.
    bool push(const uint8_t* data, size_t length);

    // Copies the oldest packet into out. False if empty or out is too small.
    bool pop(uint8_t* out, size_t outSize, size_t& length);

    void clear();

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t getCapacity() const { return capacity; }
    size_t getMaxPacketBytes() const { return slotBytes; }

    uint32_t getPushedTotal() const;
    uint32_t getDroppedTotal() const;
    uint32_t getRejectedTotal() const;
};

#endif
