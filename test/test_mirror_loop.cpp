// =============================================================================
// Local leader -> follower mirror loop
// =============================================================================

#include "mirror_loop.h"
#include "fake_motor_bus.h"

#include <gtest/gtest.h>

#include <memory>

static const std::vector<uint8_t> IDS = { 1, 2, 3 };

class MirrorLoopTest : public ::testing::Test {
protected:
    std::vector<std::unique_ptr<MotorChannel>> owned;
    std::vector<FakeMotorBus*> leaderBuses;
    std::vector<FakeMotorBus*> followerBuses;
    std::vector<MotorChannel*> leaders;
    std::vector<MotorChannel*> followers;
    MappingTable table;
    RemapQueue remaps;

    void SetUp() override {
        for (int n = 0; n < 2; n++) {
            addArm(Role::LEADER, n, 4096);
            addArm(Role::FOLLOWER, n, 4096);
        }
        ASSERT_TRUE(table.begin({ "Leader1", "Leader2" }, { "Follower1", "Follower2" }, false));

        leaderBuses[0]->setPhysical(1, 1000);
        leaderBuses[0]->setPhysical(2, 1100);
        leaderBuses[0]->setPhysical(3, 1200);
        leaderBuses[1]->setPhysical(1, 3000);
        leaderBuses[1]->setPhysical(2, 3100);
        leaderBuses[1]->setPhysical(3, 3200);
    }

    void addArm(Role role, int index, int resolution) {
        bool leader = (role == Role::LEADER);
        std::string port = "/dev/ttyUSB" + std::to_string(owned.size());
        FakeMotorBus* bus = new FakeMotorBus(port, IDS, leader ? 5.0f : 12.0f, resolution);
        bus->setFollowGoal(true);
        owned.push_back(std::make_unique<MotorChannel>(std::unique_ptr<MotorBus>(bus), IDS, resolution));
        MotorChannel* channel = owned.back().get();
        channel->assign(role, (leader ? "Leader" : "Follower") + std::to_string(index + 1));
        (leader ? leaderBuses : followerBuses).push_back(bus);
        (leader ? leaders : followers).push_back(channel);
    }
};

TEST_F(MirrorLoopTest, StateMachine) {
    MirrorLoop loop(leaders, followers, table, remaps);
    EXPECT_EQ(loop.state(), LoopState::IDLE);

    ASSERT_TRUE(loop.start());
    EXPECT_EQ(loop.state(), LoopState::RUNNING);
    EXPECT_FALSE(loop.start());

    loop.stop();
    EXPECT_EQ(loop.state(), LoopState::STOPPED);
    EXPECT_FALSE(loop.start());
}

TEST_F(MirrorLoopTest, CycleCopiesEachLeaderToItsFollower) {
    MirrorLoop loop(leaders, followers, table, remaps);
    ASSERT_TRUE(loop.start());
    EXPECT_EQ(followerBuses[0]->reg(1, FeetechReg::TORQUE_ENABLE), 1);

    loop.runCycle();

    EXPECT_EQ(followerBuses[0]->physical(1), 1000);
    EXPECT_EQ(followerBuses[0]->physical(3), 1200);
    EXPECT_EQ(followerBuses[1]->physical(1), 3000);
    EXPECT_EQ(followerBuses[1]->physical(2), 3100);
    EXPECT_EQ(loop.stats().cycles, 1u);
    EXPECT_EQ(loop.lastPositions().at("Leader2").at(3), 3200);
}

TEST_F(MirrorLoopTest, RemapTakesEffectOnTheNextCycle) {
    MirrorLoop loop(leaders, followers, table, remaps);
    ASSERT_TRUE(loop.start());
    loop.runCycle();

    remaps.post(0, 1);
    EXPECT_EQ(table.followerFor("Leader1"), "Follower1");

    followerBuses[0]->clearWrites();
    followerBuses[1]->clearWrites();
    loop.runCycle();

    EXPECT_EQ(table.followerFor("Leader1"), "Follower2");
    EXPECT_EQ(followerBuses[1]->goals(1), (std::vector<uint16_t>{ 1000 }));
    EXPECT_EQ(followerBuses[0]->goals(1), (std::vector<uint16_t>{ 3000 }));
}

TEST_F(MirrorLoopTest, UnreadableJointIsSkippedAndCounted) {
    leaderBuses[0]->setUnresponsive(2);
    MirrorLoop loop(leaders, followers, table, remaps);
    ASSERT_TRUE(loop.start());
    followerBuses[0]->clearWrites();
    loop.runCycle();

    EXPECT_TRUE(followerBuses[0]->goals(2).empty());
    EXPECT_EQ(followerBuses[0]->goals(1).size(), 1u);
    EXPECT_EQ(loop.stats().readFailures, 1u);
}

TEST_F(MirrorLoopTest, FailedWritesAreCountedAndLoopContinues) {
    followerBuses[1]->setFailWrites(3);
    MirrorLoop loop(leaders, followers, table, remaps);
    ASSERT_TRUE(loop.start());
    loop.runCycle();
    loop.runCycle();
    EXPECT_EQ(loop.stats().cycles, 2u);
    EXPECT_EQ(loop.stats().writeFailures, 2u);
    EXPECT_EQ(followerBuses[1]->physical(1), 3000);
}

TEST_F(MirrorLoopTest, CyclesOnlyWhileRunning) {
    MirrorLoop loop(leaders, followers, table, remaps);
    loop.runCycle();
    EXPECT_EQ(loop.stats().cycles, 0u);
    EXPECT_TRUE(followerBuses[0]->goals(1).empty());
}

TEST_F(MirrorLoopTest, RunStopsAfterDurationAndHoldsPose) {
    MirrorLoop loop(leaders, followers, table, remaps);
    std::atomic<bool> stop(false);
    loop.run(50, stop, 0.2);

    EXPECT_EQ(loop.state(), LoopState::STOPPED);
    EXPECT_GT(loop.stats().cycles, 0u);
    EXPECT_EQ(followerBuses[1]->physical(2), 3100);
}

TEST_F(MirrorLoopTest, RunReturnsImmediatelyWhenAlreadyStopped) {
    MirrorLoop loop(leaders, followers, table, remaps);
    std::atomic<bool> stop(true);
    loop.run(50, stop, 0.0);
    EXPECT_EQ(loop.state(), LoopState::STOPPED);
    EXPECT_EQ(loop.stats().cycles, 0u);
}

TEST(MirrorClamp, PullsValuesIntoEncoderRange) {
    uint32_t clamped = 0;
    PositionMap out = MirrorLoop::clampPositions({ { 1, -5 }, { 2, 500 }, { 3, 5000 } }, 4096, &clamped);
    EXPECT_EQ(out.at(1), 0);
    EXPECT_EQ(out.at(2), 500);
    EXPECT_EQ(out.at(3), 4095);
    EXPECT_EQ(clamped, 2u);
}

TEST(MirrorClamp, SmallerFollowerEncoder) {
    PositionMap out = MirrorLoop::clampPositions({ { 1, 3000 } }, 1024, nullptr);
    EXPECT_EQ(out.at(1), 1023);
}
