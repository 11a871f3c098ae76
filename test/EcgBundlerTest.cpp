#include <gtest/gtest.h>
#include "Fakes.h"
#include "core/PacketQueue.h"
#include "ecg/EcgBundler.h"

namespace {

class CollectingConsumer : public IEcgPacketConsumer {
public:
    std::vector<Bytes> packets;

    void onEcgPacket(const uint8_t* data, size_t length) override {
        packets.push_back(Bytes(data, data + length));
    }
};

Bytes numberedPacket(uint32_t index, size_t length) {
    Bytes packet(length, 0);
    for (size_t i = 0; i < length; i++) packet[i] = (uint8_t)(index * 31 + i);
    return packet;
}

}  // namespace

TEST(EcgBundlerTest, BundlesReproduceInputOrderAcrossStashes) {
    const size_t budget = 96;
    const size_t maxPacket = 40;
    PacketQueue queue(256, maxPacket);
    EcgBundler bundler(nullptr, budget, maxPacket);

    std::vector<Bytes> input;
    uint32_t seed = 12345;
    for (uint32_t i = 0; i < 120; i++) {
        seed = seed * 1103515245u + 12345u;
        Bytes packet = numberedPacket(i, 1 + (seed >> 16) % maxPacket);
        input.push_back(packet);
        ASSERT_TRUE(queue.push(packet.data(), packet.size()));
    }

    CollectingConsumer seen;
    CollectingConsumer unpacked;
    uint32_t captureTime = 1000;
    size_t bundles = 0;

    while (true) {
        size_t length = bundler.build(queue, captureTime, &seen);
        if (length == 0) break;
        bundles++;
        EXPECT_LE(length, budget);

        uint32_t decodedTime = 0;
        ASSERT_TRUE(EcgBundler::forEachPacket(bundler.data(), length, decodedTime, &unpacked));
        EXPECT_EQ(captureTime, decodedTime);
        captureTime += 500;
    }

    EXPECT_FALSE(bundler.hasStashedPacket());
    EXPECT_EQ(bundles, bundler.getBundlesBuilt());
    EXPECT_EQ(0u, bundler.getOversizeDropped());
    EXPECT_EQ(input, unpacked.packets);
    EXPECT_EQ(input, seen.packets);
}

TEST(EcgBundlerTest, PacketThatDoesNotFitIsStashedForNextBundle) {
    // Header 9 + two (2 + 10) entries = 33.
    PacketQueue queue(8, 16);
    EcgBundler bundler(nullptr, 33, 16);

    for (uint32_t i = 0; i < 3; i++) {
        Bytes packet = numberedPacket(i, 10);
        queue.push(packet.data(), packet.size());
    }

    EXPECT_EQ(33u, bundler.build(queue, 0, nullptr));
    EXPECT_EQ(2, bundler.data()[8]);
    EXPECT_TRUE(bundler.hasStashedPacket());
    EXPECT_TRUE(queue.empty());

    EXPECT_EQ(21u, bundler.build(queue, 0, nullptr));
    EXPECT_EQ(1, bundler.data()[8]);
    EXPECT_EQ(numberedPacket(2, 10)[0], bundler.data()[11]);
    EXPECT_FALSE(bundler.hasStashedPacket());

    EXPECT_EQ(0u, bundler.build(queue, 0, nullptr));
}

TEST(EcgBundlerTest, HeaderCarriesMagicAndCaptureTime) {
    PacketQueue queue(4, 8);
    EcgBundler bundler(nullptr, 64, 8);
    Bytes packet = numberedPacket(1, 4);
    queue.push(packet.data(), packet.size());

    ASSERT_EQ(9u + 2u + 4u, bundler.build(queue, 0x11223344u, nullptr));
    const uint8_t* data = bundler.data();
    EXPECT_EQ('E', data[0]);
    EXPECT_EQ('C', data[1]);
    EXPECT_EQ('G', data[2]);
    EXPECT_EQ('1', data[3]);
    EXPECT_EQ(0x44, data[4]);
    EXPECT_EQ(0x11, data[7]);
    EXPECT_EQ(1, data[8]);
    EXPECT_EQ(4, data[9]);
    EXPECT_EQ(0, data[10]);
}

TEST(EcgBundlerTest, PacketLargerThanBudgetIsDroppedButStillSeen) {
    PacketQueue queue(4, 32);
    EcgBundler bundler(nullptr, 20, 32);

    Bytes large = numberedPacket(1, 12);
    Bytes small = numberedPacket(2, 5);
    queue.push(large.data(), large.size());
    queue.push(small.data(), small.size());

    CollectingConsumer seen;
    EXPECT_EQ(9u + 2u + 5u, bundler.build(queue, 0, &seen));
    EXPECT_EQ(1u, bundler.getOversizeDropped());
    ASSERT_EQ(2u, seen.packets.size());
    EXPECT_EQ(large, seen.packets[0]);
}

TEST(EcgBundlerTest, EmptyQueueBuildsNothing) {
    PacketQueue queue(4, 8);
    EcgBundler bundler(nullptr, 64, 8);
    EXPECT_EQ(0u, bundler.build(queue, 0, nullptr));
    EXPECT_EQ(0u, bundler.getBundlesBuilt());
}

TEST(EcgBundlerTest, TruncatedBundleIsMalformed) {
    PacketQueue queue(4, 8);
    EcgBundler bundler(nullptr, 64, 8);
    for (uint32_t i = 0; i < 2; i++) {
        Bytes packet = numberedPacket(i, 6);
        queue.push(packet.data(), packet.size());
    }
    size_t length = bundler.build(queue, 0, nullptr);
    ASSERT_EQ(9u + 16u, length);

    CollectingConsumer unpacked;
    uint32_t captureTime = 0;
    EXPECT_FALSE(EcgBundler::forEachPacket(bundler.data(), length - 3, captureTime, &unpacked));
    EXPECT_EQ(1u, unpacked.packets.size());

    Bytes corrupt(bundler.data(), bundler.data() + length);
    corrupt[0] = 'X';
    EXPECT_FALSE(EcgBundler::forEachPacket(corrupt.data(), corrupt.size(), captureTime, nullptr));
}
