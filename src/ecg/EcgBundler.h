#ifndef ECG_BUNDLER_H
#define ECG_BUNDLER_H

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "../../include/ILogger.h"
#include "../core/PacketQueue.h"

// Sees every packet leaving the queue, once, in arrival order.
class IEcgPacketConsumer {
public:
    virtual ~IEcgPacketConsumer() = default;
    virtual void onEcgPacket(const uint8_t* data, size_t length) = 0;
};

/**
 * Packs queued vendor ECG packets into size-capped transport bundles:
 *
 *   "ECG1" | captureTimeMs u32 LE | count u8 | { length u16 LE | bytes } * count
 *
 * A packet that would overflow the byte budget is stashed and opens the
 * next bundle, so order is preserved across bundles.
 */
class EcgBundler {
public:
    static const uint8_t MAGIC[4];
    static constexpr size_t HEADER_BYTES = 9;
    static constexpr size_t LENGTH_PREFIX_BYTES = 2;
    static constexpr size_t MAX_PACKETS_PER_BUNDLE = 255;

private:
    ILogger* logger;
    size_t budgetBytes;

    std::vector<uint8_t> bundle;
    std::vector<uint8_t> scratch;
    std::vector<uint8_t> stash;
    size_t stashLength;
    bool hasStash;

    uint32_t bundlesBuilt;
    uint32_t oversizeDropped;

    bool fitsEmptyBundle(size_t length) const;
    void append(size_t& used, const uint8_t* data, size_t length);

public:
    EcgBundler(ILogger* log, size_t budgetBytes, size_t maxPacketBytes);

    // Builds at most one bundle. Returns its length, or 0 when nothing was pending.
    size_t build(PacketQueue& queue, uint32_t captureTimeMs, IEcgPacketConsumer* consumer);

    const uint8_t* data() const { return bundle.data(); }
    bool hasStashedPacket() const { return hasStash; }
    uint32_t getBundlesBuilt() const { return bundlesBuilt; }
    uint32_t getOversizeDropped() const { return oversizeDropped; }

    // Walks a bundle, validating every length against the buffer.
    // Returns false on a malformed bundle; packets before the fault are still visited.
    static bool forEachPacket(const uint8_t* data, size_t length, uint32_t& captureTimeMs,
                              IEcgPacketConsumer* consumer);
};

#endif
