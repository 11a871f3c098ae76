#include <gtest/gtest.h>
#include "Fakes.h"
#include "failover/FailoverController.h"

class FailoverControllerTest : public ::testing::Test {
protected:
    Config config;
    RecordingLogger logger;
    FakeUplinkTransport uplinkTransport;
    FakeRelayRadio radio;
    UplinkManager uplink;
    RelayLink link;
    FailoverController failover;

    FailoverControllerTest()
        : config(makeTestConfig()), uplink(&logger, &config, &uplinkTransport),
          link(&logger, &config, &radio), failover(&logger, &config, &uplink, &link) {}

    void SetUp() override {
        ASSERT_TRUE(uplink.initialize());
        ASSERT_TRUE(link.initialize());
        uplinkTransport.bringUp();
        uplink.tick(0);
        uplink.tick(0);
        ASSERT_TRUE(uplink.isEffective());
    }

    void beacon(const RelaySibling& sibling, bool uplinkOk, int8_t rssi) {
        uint8_t frame[RelayProtocol::MAX_FRAME_BYTES];
        size_t length = RelayProtocol::encodeBeacon(Beacon(sibling.relayId, uplinkOk, rssi),
                                                    frame, sizeof(frame));
        radio.deliver(sibling.mac, Bytes(frame, frame + length));
    }

    FailoverTransition step(uint32_t now) {
        uplink.tick(now);
        link.tick(now, failover.isDirect(), uplink.isEffective(), uplink.getRssi());
        return failover.tick(now);
    }
};

TEST_F(FailoverControllerTest, ForcedOutageFailsOverToBestRelay) {
    beacon(config.relay.siblings[0], true, -75);
    beacon(config.relay.siblings[1], true, -60);
    step(100);

    uplink.setForcedDown(true);
    step(1000);
    EXPECT_TRUE(failover.isDirect());

    beacon(config.relay.siblings[0], true, -75);
    beacon(config.relay.siblings[1], true, -60);
    FailoverTransition transition = step(1000 + config.failover.failoverDelayMs);

    EXPECT_TRUE(transition.changed);
    EXPECT_EQ(FailoverState::RELAYED, failover.getState());
    ASSERT_NE(nullptr, failover.getCurrentRelay());
    EXPECT_STREQ("node-C", failover.getCurrentRelay()->nodeId);
    EXPECT_EQ(1u, failover.getHandshakesSent());

    std::vector<FakeRelayRadio::Frame> starts = radio.sentOfType(4);
    ASSERT_EQ(1u, starts.size());
    EXPECT_EQ(Bytes(config.relay.siblings[1].mac, config.relay.siblings[1].mac + MAC_LENGTH),
              starts[0].mac);
}

TEST_F(FailoverControllerTest, ReleasingOutageRecoversAfterDelay) {
    beacon(config.relay.siblings[0], true, -75);
    uplink.setForcedDown(true);
    step(0);
    beacon(config.relay.siblings[0], true, -75);
    step(config.failover.failoverDelayMs);
    ASSERT_EQ(FailoverState::RELAYED, failover.getState());

    uplink.setForcedDown(false);
    uint32_t upAt = config.failover.failoverDelayMs + 100;
    beacon(config.relay.siblings[0], true, -75);
    step(upAt);
    beacon(config.relay.siblings[0], true, -75);
    EXPECT_FALSE(step(upAt + config.failover.recoverDelayMs - 1).changed);

    FailoverTransition transition = step(upAt + config.failover.recoverDelayMs);
    EXPECT_EQ(FailoverState::DIRECT, transition.to);
    EXPECT_EQ(nullptr, failover.getCurrentRelay());
}

TEST_F(FailoverControllerTest, StaleRelayIsRetargeted) {
    beacon(config.relay.siblings[0], true, -50);
    beacon(config.relay.siblings[1], true, -80);
    uplink.setForcedDown(true);
    step(0);

    uint32_t now = config.failover.failoverDelayMs - 500;
    beacon(config.relay.siblings[0], true, -50);
    beacon(config.relay.siblings[1], true, -80);
    step(now);
    step(config.failover.failoverDelayMs);
    ASSERT_STREQ("node-B", failover.getCurrentRelay()->nodeId);

    // Only node C keeps beaconing.
    now = config.failover.failoverDelayMs + 2000;
    beacon(config.relay.siblings[1], true, -80);
    step(now);
    now += config.relay.staleWindowMs - 2000;
    beacon(config.relay.siblings[1], true, -80);
    step(now);

    EXPECT_EQ(FailoverState::RELAYED, failover.getState());
    ASSERT_NE(nullptr, failover.getCurrentRelay());
    EXPECT_STREQ("node-C", failover.getCurrentRelay()->nodeId);
    EXPECT_EQ(1u, failover.getRetargets());
    EXPECT_EQ(2u, failover.getHandshakesSent());
}

TEST_F(FailoverControllerTest, NoViableSiblingStrandsTheNode) {
    uplink.setForcedDown(true);
    step(0);
    FailoverTransition transition = step(config.failover.failoverDelayMs);

    EXPECT_EQ(FailoverState::STRANDED, transition.to);
    EXPECT_EQ(nullptr, failover.getCurrentRelay());
    EXPECT_TRUE(radio.sentOfType(4).empty());
}
