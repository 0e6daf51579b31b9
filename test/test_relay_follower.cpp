// =============================================================================
// Relay follower: sequence/latency guard, smoothing, acks
// =============================================================================

#include "relay_follower.h"
#include "relay_leader.h"
#include "config.h"
#include "debug_log.h"
#include "fake_motor_bus.h"
#include "loopback_transport.h"

#include <gtest/gtest.h>

#include <memory>

static const std::vector<uint8_t> IDS = { 1, 2 };

// ---------------------------------------------------------------------------
// TelemetryGate
// ---------------------------------------------------------------------------

TEST(TelemetryGate, AppliesOnlyIncreasingSequences) {
    TelemetryGate gate(200.0, 10);
    const uint64_t arrivals[] = { 5, 3, 6, 4, 7 };
    std::vector<uint64_t> applied;
    for (uint64_t seq : arrivals) {
        if (gate.check(seq, 10.0) == TelemetryVerdict::APPLY) {
            gate.accept(seq);
            applied.push_back(seq);
        }
    }
    EXPECT_EQ(applied, (std::vector<uint64_t>{ 5, 6, 7 }));
    EXPECT_EQ(gate.droppedStale(), 2u);
    EXPECT_EQ(gate.lastApplied(), 7u);
}

TEST(TelemetryGate, DuplicateIsStale) {
    TelemetryGate gate(200.0, 10);
    ASSERT_EQ(gate.check(9, 0.0), TelemetryVerdict::APPLY);
    gate.accept(9);
    EXPECT_EQ(gate.check(9, 0.0), TelemetryVerdict::OUT_OF_ORDER);
}

TEST(TelemetryGate, DropsMessagesOverMaxLatency) {
    TelemetryGate gate(200.0, 3);
    EXPECT_EQ(gate.check(1, 250.0), TelemetryVerdict::LATENCY_EXCEEDED);
    EXPECT_EQ(gate.check(2, 200.0), TelemetryVerdict::APPLY);
    EXPECT_EQ(gate.droppedLate(), 1u);
}

TEST(TelemetryGate, LateRunResetsOnRecovery) {
    TelemetryGate gate(200.0, 3);
    for (uint64_t seq = 1; seq <= 4; seq++) {
        EXPECT_EQ(gate.check(seq, 500.0), TelemetryVerdict::LATENCY_EXCEEDED);
    }
    EXPECT_EQ(gate.consecutiveLate(), 4);
    EXPECT_EQ(gate.check(5, 20.0), TelemetryVerdict::APPLY);
    EXPECT_EQ(gate.consecutiveLate(), 0);
    EXPECT_EQ(gate.droppedLate(), 4u);
}

TEST(TelemetryGate, UnknownLatencyIsAcceptedAndCounted) {
    TelemetryGate gate(200.0, 10);
    EXPECT_EQ(gate.check(1, -1.0), TelemetryVerdict::APPLY);
    EXPECT_EQ(gate.unestimated(), 1u);
}

TEST(TelemetryGate, ResetSequenceAcceptsLowerNumbers) {
    TelemetryGate gate(200.0, 10);
    gate.accept(1000);
    gate.resetSequence();
    EXPECT_FALSE(gate.hasApplied());
    EXPECT_EQ(gate.check(1, 0.0), TelemetryVerdict::APPLY);
}

TEST(TelemetryGate, CountsSkippedSequencesWithinASession) {
    TelemetryGate gate(200.0, 10);
    gate.accept(1);
    gate.accept(4);
    EXPECT_EQ(gate.gapped(), 2u);
    gate.accept(5);
    EXPECT_EQ(gate.gapped(), 2u);

    gate.resetSequence();
    gate.accept(100);
    EXPECT_EQ(gate.gapped(), 2u);
}

TEST(TelemetryGate, LatencyWindowKeepsRecentSamples) {
    TelemetryGate gate(200.0, 10);
    EXPECT_LT(gate.latencyAvgMs(), 0.0);
    EXPECT_LT(gate.latencyPeakMs(), 0.0);

    gate.check(1, 10.0);
    gate.check(2, 30.0);
    gate.check(3, 500.0);
    gate.check(4, -1.0);
    EXPECT_DOUBLE_EQ(gate.latencyAvgMs(), 180.0);
    EXPECT_DOUBLE_EQ(gate.latencyPeakMs(), 500.0);

    for (uint64_t seq = 5; seq < 5 + RELAY_LATENCY_SAMPLES; seq++) {
        gate.check(seq, 20.0);
    }
    EXPECT_DOUBLE_EQ(gate.latencyAvgMs(), 20.0);
    EXPECT_DOUBLE_EQ(gate.latencyPeakMs(), 20.0);
}

// ---------------------------------------------------------------------------
// RelayFollower against a fake arm
// ---------------------------------------------------------------------------

class RelayFollowerTest : public ::testing::Test {
protected:
    LoopbackRelay relay;
    LoopbackTransport transport{relay};
    FakeMotorBus* bus = nullptr;
    std::unique_ptr<MotorChannel> channel;
    MappingTable table;
    RemapQueue remaps;
    std::unique_ptr<RelayFollower> follower;

    void SetUp() override {
        bus = new FakeMotorBus("/dev/ttyUSB1", IDS, 12.0f);
        bus->setPhysical(1, 1000);
        bus->setPhysical(2, 2048);
        channel = std::make_unique<MotorChannel>(std::unique_ptr<MotorBus>(bus), IDS, 4096);
        channel->assign(Role::FOLLOWER, "Follower1");
        ASSERT_TRUE(table.begin({ "Leader1" }, { "Follower1" }, false));

        RelayFollowerConfig config;
        config.nodeId = "test-follower";
        follower = std::make_unique<RelayFollower>(std::vector<MotorChannel*>{ channel.get() }, table, remaps,
                                                   transport, config);
        ASSERT_TRUE(follower->begin());
        bus->clearWrites();
    }

    void TearDown() override {
        follower->end();
    }

    static TelemetryMessage telemetry(uint32_t session, uint64_t seq, int64_t ts, int j1, int j2) {
        TelemetryMessage msg;
        msg.session = session;
        msg.sequence = seq;
        msg.timestampUs = ts;
        msg.positions["Leader1"][1] = j1;
        msg.positions["Leader1"][2] = j2;
        return msg;
    }

    std::vector<AckMessage> acks() {
        std::vector<AckMessage> out;
        for (const auto& sent : transport.published()) {
            AckMessage ack;
            if (sent.first == RELAY_CHANNEL_STATUS && peekMessageType(sent.second) == MessageType::ACK &&
                decodeAck(sent.second, ack)) {
                out.push_back(ack);
            }
        }
        return out;
    }
};

TEST_F(RelayFollowerTest, BeginEnablesTorqueFromPresentPose) {
    PositionMap commanded = follower->lastCommanded("Follower1");
    EXPECT_EQ(commanded.at(1), 1000);
    EXPECT_EQ(commanded.at(2), 2048);
    EXPECT_EQ(bus->reg(1, FeetechReg::TORQUE_ENABLE), 1);
}

TEST_F(RelayFollowerTest, AppliesSmoothedStepAndAcks) {
    int64_t ts = 1760000000000000LL;
    TelemetryMessage msg = telemetry(42, 100, ts, 2048, 2048);

    EXPECT_EQ(follower->processTelemetry(msg, ts + 50000), TelemetryVerdict::APPLY);

    EXPECT_EQ(bus->goals(1), (std::vector<uint16_t>{ 1200 }));
    EXPECT_EQ(bus->goals(2), (std::vector<uint16_t>{ 2048 }));
    EXPECT_EQ(follower->gate().lastApplied(), 100u);
    EXPECT_EQ(follower->applied(), 1u);

    std::vector<AckMessage> sent = acks();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].sequence, 100u);
    EXPECT_EQ(sent[0].session, 42u);
    EXPECT_EQ(sent[0].timestampUs, ts);
    EXPECT_EQ(sent[0].nodeId, "test-follower");
}

TEST_F(RelayFollowerTest, StatusReportsGapsAndLatency) {
    int64_t ts = 1760000000000000LL;
    ASSERT_EQ(follower->processTelemetry(telemetry(42, 1, ts, 1000, 2048), ts + 40000), TelemetryVerdict::APPLY);
    ASSERT_EQ(follower->processTelemetry(telemetry(42, 5, ts, 1000, 2048), ts + 60000), TelemetryVerdict::APPLY);

    follower->poll(RELAY_STATUS_INTERVAL_MS);
    FollowerCounters c = follower->counters();
    EXPECT_EQ(c.gapped, 3u);
    EXPECT_DOUBLE_EQ(c.avgLatencyMs, 50.0);
    EXPECT_DOUBLE_EQ(c.maxLatencyMs, 60.0);

    StatusMessage status;
    bool found = false;
    for (const auto& sent : transport.published()) {
        if (peekMessageType(sent.second) == MessageType::STATUS) {
            found = decodeStatus(sent.second, status);
        }
    }
    ASSERT_TRUE(found);
    EXPECT_EQ(status.gapped, 3u);
    EXPECT_DOUBLE_EQ(status.latencyAvgMs, 50.0);
    EXPECT_DOUBLE_EQ(status.latencyMaxMs, 60.0);

    JsonDocument doc;
    follower->fillStatus(doc.to<JsonObject>());
    EXPECT_EQ(doc["gapped"].as<uint64_t>(), 3u);
    EXPECT_DOUBLE_EQ(doc["latencyMaxMs"].as<double>(), 60.0);
}

TEST_F(RelayFollowerTest, LateMessageLeavesArmWhereItIs) {
    int64_t ts = 1760000000000000LL;
    TelemetryMessage msg = telemetry(42, 1, ts, 3000, 3000);

    EXPECT_EQ(follower->processTelemetry(msg, ts + 250000), TelemetryVerdict::LATENCY_EXCEEDED);
    EXPECT_TRUE(bus->goals(1).empty());
    EXPECT_EQ(follower->lastCommanded("Follower1").at(1), 1000);
    EXPECT_EQ(follower->gate().droppedLate(), 1u);
    EXPECT_TRUE(acks().empty());
}

TEST_F(RelayFollowerTest, OutOfOrderArrivalsApplyOnlyNewer) {
    int64_t ts = 1760000000000000LL;
    const uint64_t arrivals[] = { 5, 3, 6, 4, 7 };
    for (uint64_t seq : arrivals) {
        follower->processTelemetry(telemetry(42, seq, ts, 2048, 2048), ts + 1000);
    }
    EXPECT_EQ(follower->applied(), 3u);
    EXPECT_EQ(follower->gate().droppedStale(), 2u);
    EXPECT_EQ(bus->goals(1).size(), 3u);

    std::vector<AckMessage> sent = acks();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[2].sequence, 7u);
}

TEST_F(RelayFollowerTest, MissingTimestampIsAppliedAsUnestimated) {
    TelemetryMessage msg = telemetry(42, 1, 0, 2048, 2048);
    msg.hasTimestamp = false;

    EXPECT_EQ(follower->processTelemetry(msg, wallClockMicros()), TelemetryVerdict::APPLY);
    EXPECT_EQ(follower->gate().unestimated(), 1u);
}

TEST_F(RelayFollowerTest, RestartedLeaderResetsSequenceAndRetiresOldSession) {
    int64_t ts = 1760000000000000LL;
    EXPECT_EQ(follower->processTelemetry(telemetry(1, 500, ts, 2048, 2048), ts), TelemetryVerdict::APPLY);

    // New session starts counting from 1 again
    EXPECT_EQ(follower->processTelemetry(telemetry(2, 1, ts, 2048, 2048), ts), TelemetryVerdict::APPLY);
    EXPECT_EQ(follower->gate().lastApplied(), 1u);

    // A straggler from the old session must not move the arm
    EXPECT_EQ(follower->processTelemetry(telemetry(1, 501, ts, 0, 0), ts), TelemetryVerdict::OUT_OF_ORDER);
    EXPECT_EQ(follower->applied(), 2u);
}

TEST_F(RelayFollowerTest, OnlyJointsTheArmHasAreWritten) {
    int64_t ts = 1760000000000000LL;
    TelemetryMessage msg = telemetry(42, 1, ts, 2048, 2048);
    msg.positions["Leader1"][9] = 100;
    msg.positions["Leader7"][1] = 100;

    EXPECT_EQ(follower->processTelemetry(msg, ts), TelemetryVerdict::APPLY);
    for (const FakeWrite& w : bus->writes()) {
        EXPECT_NE(w.id, 9);
    }
    EXPECT_EQ(bus->goals(1).size(), 1u);
}

TEST(RelayFollowerSeeding, JointUnreadableAtStartIsSeededBeforeMoving) {
    LoopbackRelay relay;
    LoopbackTransport transport(relay);
    FakeMotorBus* bus = new FakeMotorBus("/dev/ttyUSB1", IDS, 12.0f);
    bus->setPhysical(1, 1000);
    bus->setPhysical(2, 3000);
    bus->setUnresponsive(2);
    MotorChannel arm(std::unique_ptr<MotorBus>(bus), IDS, 4096);
    arm.assign(Role::FOLLOWER, "Follower1");

    MappingTable table;
    RemapQueue remaps;
    ASSERT_TRUE(table.begin({ "Leader1" }, { "Follower1" }, false));
    RelayFollower follower({ &arm }, table, remaps, transport, RelayFollowerConfig());
    ASSERT_TRUE(follower.begin());
    bus->clearWrites();

    TelemetryMessage msg;
    msg.session = 7;
    msg.sequence = 1;
    msg.timestampUs = 1760000000000000LL;
    msg.positions["Leader1"] = { { 1, 2048 }, { 2, 4000 } };

    // Still silent: joint 2 holds instead of jumping to its target
    ASSERT_EQ(follower.processTelemetry(msg, msg.timestampUs), TelemetryVerdict::APPLY);
    EXPECT_EQ(bus->goals(1), (std::vector<uint16_t>{ 1200 }));
    EXPECT_TRUE(bus->goals(2).empty());

    bus->setResponsive(2);
    msg.sequence = 2;
    ASSERT_EQ(follower.processTelemetry(msg, msg.timestampUs), TelemetryVerdict::APPLY);
    EXPECT_EQ(bus->goals(2), (std::vector<uint16_t>{ 3200 }));

    follower.end();
}

TEST_F(RelayFollowerTest, WriteFailuresAreCountedNotFatal) {
    bus->setFailWrites(2);
    int64_t ts = 1760000000000000LL;
    EXPECT_EQ(follower->processTelemetry(telemetry(42, 1, ts, 2048, 2048), ts), TelemetryVerdict::APPLY);
    follower->poll(logMillis());
    EXPECT_EQ(follower->counters().writeFailures, 1u);
    EXPECT_EQ(follower->counters().applied, 1u);
}

TEST_F(RelayFollowerTest, LeaderLivenessFollowsLastMessage) {
    EXPECT_EQ(follower->peerState(logMillis()), PeerState::WAITING);

    int64_t ts = wallClockMicros();
    follower->processTelemetry(telemetry(42, 1, ts, 2048, 2048), ts);
    unsigned long now = logMillis();
    EXPECT_EQ(follower->peerState(now), PeerState::CONNECTED);
    EXPECT_EQ(follower->peerState(now + RELAY_PEER_SLOW_MS + 500), PeerState::SLOW);
    EXPECT_EQ(follower->peerState(now + RELAY_STATUS_TIMEOUT_MS + 500), PeerState::DISCONNECTED);
}

TEST_F(RelayFollowerTest, PublishesStatusOnInterval) {
    follower->poll(RELAY_STATUS_INTERVAL_MS);
    follower->poll(RELAY_STATUS_INTERVAL_MS + 10);

    int statuses = 0;
    for (const auto& sent : transport.published()) {
        StatusMessage status;
        if (peekMessageType(sent.second) == MessageType::STATUS && decodeStatus(sent.second, status)) {
            EXPECT_EQ(status.role, "follower");
            EXPECT_EQ(status.nodeId, "test-follower");
            EXPECT_EQ(status.arms, 1);
            statuses++;
        }
    }
    EXPECT_EQ(statuses, 1);
}

TEST_F(RelayFollowerTest, RemapRedirectsTelemetryAtNextDrain) {
    // Second follower arm
    FakeMotorBus* bus2 = new FakeMotorBus("/dev/ttyUSB3", IDS, 12.0f);
    MotorChannel channel2(std::unique_ptr<MotorBus>(bus2), IDS, 4096);
    channel2.assign(Role::FOLLOWER, "Follower2");

    LoopbackRelay relay2;
    LoopbackTransport transport2(relay2);
    MappingTable table2;
    RemapQueue remaps2;
    ASSERT_TRUE(table2.begin({ "Leader1", "Leader2" }, { "Follower1", "Follower2" }, false));
    RelayFollowerConfig config;
    config.maxStep = 4096;
    config.smoothing = 0.0;
    RelayFollower two({ channel.get(), &channel2 }, table2, remaps2, transport2, config);
    ASSERT_TRUE(two.begin());
    bus->clearWrites();
    bus2->clearWrites();

    remaps2.post(0, 1);

    int64_t ts = wallClockMicros();
    TelemetryMessage msg = telemetry(42, 1, ts, 100, 100);
    msg.positions["Leader2"][1] = 3000;
    msg.positions["Leader2"][2] = 3000;
    two.onMessage(RELAY_CHANNEL_TELEMETRY, encodeTelemetry(msg), ts);
    EXPECT_EQ(two.drainInbox(), 1);

    // Leader1 now drives Follower2
    EXPECT_EQ(bus2->goals(1), (std::vector<uint16_t>{ 100 }));
    EXPECT_EQ(bus->goals(1), (std::vector<uint16_t>{ 3000 }));
    two.end();
}

// ---------------------------------------------------------------------------
// Leader and follower over an in-process relay
// ---------------------------------------------------------------------------

TEST(RelayRoundTrip, LeaderPoseReachesFollowerAndAckReturns) {
    LoopbackRelay relay;
    LoopbackTransport leaderLink(relay);
    LoopbackTransport followerLink(relay);

    FakeMotorBus* leaderBus = new FakeMotorBus("/dev/ttyUSB0", IDS, 5.0f);
    leaderBus->setPhysical(1, 2100);
    leaderBus->setPhysical(2, 1900);
    MotorChannel leaderArm(std::unique_ptr<MotorBus>(leaderBus), IDS, 4096);
    leaderArm.assign(Role::LEADER, "Leader1");

    FakeMotorBus* followerBus = new FakeMotorBus("/dev/ttyUSB1", IDS, 12.0f);
    followerBus->setFollowGoal(true);
    MotorChannel followerArm(std::unique_ptr<MotorBus>(followerBus), IDS, 4096);
    followerArm.assign(Role::FOLLOWER, "Follower1");

    MappingTable table;
    RemapQueue remaps;
    ASSERT_TRUE(table.begin({ "Leader1" }, { "Follower1" }, false));

    RelayLeaderConfig leaderConfig;
    RelayLeader leader({ &leaderArm }, leaderLink, leaderConfig);
    RelayFollowerConfig followerConfig;
    RelayFollower follower({ &followerArm }, table, remaps, followerLink, followerConfig);

    ASSERT_TRUE(leader.begin());
    ASSERT_TRUE(follower.begin());

    for (int n = 0; n < 40; n++) {
        leader.publishCycle();
        follower.drainInbox();
    }

    EXPECT_EQ(leader.lastSequence(), 40u);
    EXPECT_EQ(follower.gate().lastApplied(), 40u);
    EXPECT_EQ(followerBus->physical(1), 2100);
    EXPECT_EQ(followerBus->physical(2), 1900);

    NetworkStats net = leader.networkStats();
    EXPECT_EQ(net.sent, 40u);
    EXPECT_EQ(net.acked, 40u);
    EXPECT_GE(net.avgRttMs, 0.0);
    EXPECT_TRUE(leader.followerConnected());

    follower.end();
    leader.end();
}
