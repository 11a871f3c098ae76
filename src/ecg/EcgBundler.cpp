#include "EcgBundler.h"
#include <string.h>

const uint8_t EcgBundler::MAGIC[4] = { 'E', 'C', 'G', '1' };
constexpr size_t EcgBundler::HEADER_BYTES;
constexpr size_t EcgBundler::LENGTH_PREFIX_BYTES;
constexpr size_t EcgBundler::MAX_PACKETS_PER_BUNDLE;

EcgBundler::EcgBundler(ILogger* log, size_t budget, size_t maxPacketBytes)
    : logger(log), budgetBytes(budget), bundle(budget, 0), scratch(maxPacketBytes, 0),
      stash(maxPacketBytes, 0), stashLength(0), hasStash(false), bundlesBuilt(0),
      oversizeDropped(0) {
}

bool EcgBundler::fitsEmptyBundle(size_t length) const {
    return HEADER_BYTES + LENGTH_PREFIX_BYTES + length <= budgetBytes;
}

void EcgBundler::append(size_t& used, const uint8_t* data, size_t length) {
    bundle[used++] = (uint8_t)(length & 0xFF);
    bundle[used++] = (uint8_t)((length >> 8) & 0xFF);
    memcpy(&bundle[used], data, length);
    used += length;
}

size_t EcgBundler::build(PacketQueue& queue, uint32_t captureTimeMs, IEcgPacketConsumer* consumer) {
    size_t used = HEADER_BYTES;
    size_t packets = 0;

    if (hasStash) {
        append(used, stash.data(), stashLength);
        packets++;
        hasStash = false;
        stashLength = 0;
    }

    while (packets < MAX_PACKETS_PER_BUNDLE) {
        size_t length = 0;
        if (!queue.pop(scratch.data(), scratch.size(), length)) break;

        if (consumer) consumer->onEcgPacket(scratch.data(), length);

        if (!fitsEmptyBundle(length)) {
            oversizeDropped++;
            if (logger) logger->warningf("ECG packet of %u B exceeds bundle budget, dropped",
                                         (unsigned)length);
            continue;
        }

        if (used + LENGTH_PREFIX_BYTES + length > budgetBytes) {
            memcpy(stash.data(), scratch.data(), length);
            stashLength = length;
            hasStash = true;
            break;
        }

        append(used, scratch.data(), length);
        packets++;
    }

    if (packets == 0) return 0;

    memcpy(&bundle[0], MAGIC, sizeof(MAGIC));
    bundle[4] = (uint8_t)(captureTimeMs & 0xFF);
    bundle[5] = (uint8_t)((captureTimeMs >> 8) & 0xFF);
    bundle[6] = (uint8_t)((captureTimeMs >> 16) & 0xFF);
    bundle[7] = (uint8_t)((captureTimeMs >> 24) & 0xFF);
    bundle[8] = (uint8_t)packets;

    bundlesBuilt++;
    if (logger) logger->debugf("ECG bundle #%lu: %u packets, %u B%s", (unsigned long)bundlesBuilt,
                               (unsigned)packets, (unsigned)used, hasStash ? " (stashed 1)" : "");
    return used;
}

bool EcgBundler::forEachPacket(const uint8_t* data, size_t length, uint32_t& captureTimeMs,
                               IEcgPacketConsumer* consumer) {
    if (!data || length < HEADER_BYTES || memcmp(data, MAGIC, sizeof(MAGIC)) != 0) return false;

    captureTimeMs = (uint32_t)data[4] | ((uint32_t)data[5] << 8) |
                    ((uint32_t)data[6] << 16) | ((uint32_t)data[7] << 24);
    size_t packets = data[8];
    size_t offset = HEADER_BYTES;

    for (size_t i = 0; i < packets; i++) {
        if (offset + LENGTH_PREFIX_BYTES > length) return false;
        size_t packetLength = (size_t)data[offset] | ((size_t)data[offset + 1] << 8);
        offset += LENGTH_PREFIX_BYTES;
        if (offset + packetLength > length) return false;
        if (consumer) consumer->onEcgPacket(&data[offset], packetLength);
        offset += packetLength;
    }

    return offset == length;
}
