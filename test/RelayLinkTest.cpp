#include <gtest/gtest.h>
#include "Fakes.h"
#include "relay/RelayLink.h"

namespace {

class StubCapsuleSource : public ICapsuleSource {
public:
    int requests;

    StubCapsuleSource() : requests(0) {}

    bool buildCapsule(Capsule& capsule) override {
        requests++;
        capsule = Capsule();
        capsule.bpm = 91;
        capsule.bleOk = true;
        return true;
    }
};

class RecordingCapsuleSink : public ICapsuleSink {
public:
    std::vector<std::string> senders;
    std::vector<Capsule> capsules;

    bool onSiblingCapsule(const RelaySibling& sibling, const Capsule& capsule) override {
        senders.push_back(sibling.nodeId);
        capsules.push_back(capsule);
        return true;
    }
};

Bytes beaconFrame(uint8_t relayId, bool uplinkOk, int8_t rssi) {
    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeBeacon(Beacon(relayId, uplinkOk, rssi), frame, sizeof(frame));
    return Bytes(frame, frame + length);
}

}  // namespace

class RelayLinkTest : public ::testing::Test {
protected:
    Config config;
    RecordingLogger logger;
    FakeRelayRadio radio;
    RelayLink link;
    StubCapsuleSource source;
    RecordingCapsuleSink sink;

    const RelaySibling& nodeB;
    const RelaySibling& nodeC;

    RelayLinkTest()
        : config(makeTestConfig()), link(&logger, &config, &radio),
          nodeB(config.relay.siblings[0]), nodeC(config.relay.siblings[1]) {}

    void SetUp() override {
        ASSERT_TRUE(link.initialize());
        link.setCapsuleSource(&source);
        link.setCapsuleSink(&sink);
    }
};

TEST_F(RelayLinkTest, InitializeRegistersSiblingsOnChannel) {
    EXPECT_EQ(6, radio.channel);
    ASSERT_EQ(2u, radio.peers.size());
    EXPECT_EQ(Bytes(nodeC.mac, nodeC.mac + MAC_LENGTH), radio.peers[1]);
    EXPECT_NE(nullptr, radio.sink);
}

TEST_F(RelayLinkTest, BeaconsGoToEverySiblingEachInterval) {
    link.tick(0, false, true, -55);
    EXPECT_EQ(2u, radio.sentOfType(1).size());

    link.tick(config.relay.beaconIntervalMs - 1, false, true, -55);
    EXPECT_EQ(2u, radio.sentOfType(1).size());

    link.tick(config.relay.beaconIntervalMs, false, false, 0);
    std::vector<FakeRelayRadio::Frame> beacons = radio.sentOfType(1);
    ASSERT_EQ(4u, beacons.size());
    EXPECT_EQ(config.identity.relayId, beacons[3].data[3]);
    EXPECT_EQ(0, beacons[3].data[4]);
}

TEST_F(RelayLinkTest, FreshBeaconWithUplinkMakesSiblingViable) {
    radio.deliver(nodeB.mac, beaconFrame(2, true, -70));
    link.tick(1000, false, false, 0);

    EXPECT_TRUE(link.isViable(nodeB, 1000));
    EXPECT_FALSE(link.isViable(nodeC, 1000));
    EXPECT_EQ(1u, link.viablePeerCount(1000));

    EXPECT_TRUE(link.isViable(nodeB, 1000 + config.relay.staleWindowMs - 1));
    EXPECT_FALSE(link.isViable(nodeB, 1000 + config.relay.staleWindowMs));
    EXPECT_FALSE(link.hasViableRelay(1000 + config.relay.staleWindowMs));
}

TEST_F(RelayLinkTest, SiblingWithoutUplinkIsNotViable) {
    radio.deliver(nodeB.mac, beaconFrame(2, false, -40));
    link.tick(0, false, false, 0);

    ASSERT_NE(nullptr, link.getPeer(nodeB));
    EXPECT_TRUE(link.getPeer(nodeB)->heard);
    EXPECT_FALSE(link.isViable(nodeB, 0));
    EXPECT_EQ(nullptr, link.selectRelay(0));
}

TEST_F(RelayLinkTest, SelectsStrongestViableSibling) {
    radio.deliver(nodeB.mac, beaconFrame(2, true, -80));
    radio.deliver(nodeC.mac, beaconFrame(3, true, -50));
    link.tick(0, false, false, 0);

    const RelaySibling* relay = link.selectRelay(0);
    ASSERT_NE(nullptr, relay);
    EXPECT_STREQ("node-C", relay->nodeId);

    radio.deliver(nodeC.mac, beaconFrame(3, false, -50));
    link.tick(100, false, false, 0);
    relay = link.selectRelay(100);
    ASSERT_NE(nullptr, relay);
    EXPECT_STREQ("node-B", relay->nodeId);
}

TEST_F(RelayLinkTest, FramesFromStrangersAndGarbageAreRejected) {
    const uint8_t stranger[MAC_LENGTH] = { 0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01 };
    radio.deliver(stranger, beaconFrame(9, true, -30));

    Bytes garbage = beaconFrame(2, true, -30);
    garbage[0] = 7;
    radio.deliver(nodeB.mac, garbage);

    link.tick(0, false, false, 0);

    EXPECT_EQ(2u, link.getFramesReceived());
    EXPECT_EQ(2u, link.getFramesRejected());
    EXPECT_FALSE(link.hasViableRelay(0));
}

TEST_F(RelayLinkTest, ForwardRequestIsAnsweredWithOneCapsuleWhenNotDirect) {
    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeForwardRequest(2, frame, sizeof(frame));
    radio.deliver(nodeB.mac, Bytes(frame, frame + length));

    link.tick(0, false, false, 0);

    std::vector<FakeRelayRadio::Frame> capsules = radio.sentOfType(3);
    ASSERT_EQ(1u, capsules.size());
    EXPECT_EQ(Bytes(nodeB.mac, nodeB.mac + MAC_LENGTH), capsules[0].mac);
    EXPECT_EQ(1, source.requests);
    EXPECT_EQ(1u, link.getCapsulesAnswered());

    Capsule decoded;
    ASSERT_TRUE(RelayProtocol::decodeCapsule(&capsules[0].data[RelayProtocol::HEADER_BYTES],
                                             RelayProtocol::CAPSULE_PAYLOAD, decoded));
    EXPECT_EQ(config.identity.relayId, decoded.sourceId);
    EXPECT_EQ(91, decoded.bpm);
}

TEST_F(RelayLinkTest, DirectNodeIgnoresForwardRequests) {
    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeForwardRequest(2, frame, sizeof(frame));
    radio.deliver(nodeB.mac, Bytes(frame, frame + length));

    link.tick(0, true, true, -50);

    EXPECT_TRUE(radio.sentOfType(3).empty());
    EXPECT_EQ(0, source.requests);
}

TEST_F(RelayLinkTest, DirectNodePullsSiblingsPeriodically) {
    link.tick(0, true, true, -50);
    EXPECT_EQ(2u, radio.sentOfType(2).size());

    link.tick(config.relay.forwardRequestIntervalMs - 1, true, true, -50);
    EXPECT_EQ(2u, radio.sentOfType(2).size());

    link.tick(config.relay.forwardRequestIntervalMs, true, true, -50);
    EXPECT_EQ(4u, radio.sentOfType(2).size());

    link.tick(3 * config.relay.forwardRequestIntervalMs, false, false, 0);
    EXPECT_EQ(4u, radio.sentOfType(2).size());
}

TEST_F(RelayLinkTest, CapsulesReachSinkOnlyWhileDirect) {
    Capsule capsule;
    capsule.bpm = 77;
    uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
    size_t length = RelayProtocol::encodeCapsule(capsule, frame, sizeof(frame));
    Bytes encoded(frame, frame + length);

    radio.deliver(nodeC.mac, encoded);
    link.tick(0, true, true, -50);
    ASSERT_EQ(1u, sink.capsules.size());
    EXPECT_EQ("node-C", sink.senders[0]);
    EXPECT_EQ(77, sink.capsules[0].bpm);
    EXPECT_EQ(1u, link.getCapsulesForwarded());

    radio.deliver(nodeC.mac, encoded);
    link.tick(100, false, false, 0);
    EXPECT_EQ(1u, sink.capsules.size());
    EXPECT_EQ(1u, link.getCapsulesDropped());
}

TEST_F(RelayLinkTest, SendCapsuleStampsSourceAndSequence) {
    Capsule first;
    Capsule second;
    ASSERT_TRUE(link.sendCapsule(nodeB, first));
    ASSERT_TRUE(link.sendCapsule(nodeB, second));

    EXPECT_EQ(config.identity.relayId, first.sourceId);
    EXPECT_EQ(0, first.seq);
    EXPECT_EQ(1, second.seq);
    EXPECT_EQ(2u, link.getCapsulesSent());

    radio.sendResult = false;
    Capsule third;
    EXPECT_FALSE(link.sendCapsule(nodeB, third));
    EXPECT_EQ(2u, link.getCapsulesSent());
}

TEST_F(RelayLinkTest, RelayStartGoesOnlyToChosenSibling) {
    ASSERT_TRUE(link.sendRelayStart(nodeC));

    std::vector<FakeRelayRadio::Frame> starts = radio.sentOfType(4);
    ASSERT_EQ(1u, starts.size());
    EXPECT_EQ(Bytes(nodeC.mac, nodeC.mac + MAC_LENGTH), starts[0].mac);
    EXPECT_EQ(config.identity.relayId, starts[0].data[3]);

    radio.deliver(nodeB.mac, starts[0].data);
    link.tick(0, true, true, -50);
    EXPECT_TRUE(logger.contains("now relays through this node"));
}

TEST(RelayLinkInitTest, FailsWhenRadioDoesNotStart) {
    Config config = makeTestConfig();
    FakeRelayRadio radio;
    radio.beginResult = false;

    RelayLink link(nullptr, &config, &radio);
    EXPECT_FALSE(link.initialize());
    EXPECT_EQ(nullptr, radio.sink);
}
