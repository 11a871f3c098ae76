#include "PacketQueue.h"
#include <string.h>

PacketQueue::PacketQueue(size_t cap, size_t maxPacketBytes)
    : capacity(cap > 0 ? cap : 1), slotBytes(maxPacketBytes > 0 ? maxPacketBytes : 1),
      storage(capacity * slotBytes, 0), lengths(capacity, 0), head(0), count(0),
      pushedTotal(0), droppedTotal(0), rejectedTotal(0) {
}

bool PacketQueue::push(const uint8_t* data, size_t length) {
    CriticalSection::Guard guard(section);

    if (!data || length == 0 || length > slotBytes) {
        rejectedTotal++;
        return false;
    }

    if (count == capacity) {
        head = (head + 1) % capacity;
        count--;
        droppedTotal++;
    }

    size_t tail = (head + count) % capacity;
    memcpy(&storage[tail * slotBytes], data, length);
    lengths[tail] = (uint16_t)length;
    count++;
    pushedTotal++;
    return true;
}

bool PacketQueue::pop(uint8_t* out, size_t outSize, size_t& length) {
    CriticalSection::Guard guard(section);

    length = 0;
    if (count == 0) return false;

    size_t stored = lengths[head];
    if (!out || outSize < stored) return false;

    memcpy(out, &storage[head * slotBytes], stored);
    length = stored;
    head = (head + 1) % capacity;
    count--;
    return true;
}

void PacketQueue::clear() {
    CriticalSection::Guard guard(section);
    head = 0;
    count = 0;
}

size_t PacketQueue::size() const {
    CriticalSection::Guard guard(section);
    return count;
}

uint32_t PacketQueue::getPushedTotal() const {
    CriticalSection::Guard guard(section);
    return pushedTotal;
}

uint32_t PacketQueue::getDroppedTotal() const {
    CriticalSection::Guard guard(section);
    return droppedTotal;
}

uint32_t PacketQueue::getRejectedTotal() const {
    CriticalSection::Guard guard(section);
    return rejectedTotal;
}
