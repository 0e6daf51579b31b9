// =============================================================================
// Leader link quality from follower acks
// =============================================================================

#include "network_monitor.h"

#include <gtest/gtest.h>

TEST(NetworkMonitor, NoSamplesYet) {
    NetworkMonitor monitor(100, 1000);
    NetworkStats s = monitor.stats();
    EXPECT_EQ(s.sent, 0u);
    EXPECT_LT(s.avgRttMs, 0.0);
    EXPECT_DOUBLE_EQ(s.lossRate, 0.0);
}

TEST(NetworkMonitor, MatchesAcksToSends) {
    NetworkMonitor monitor(100, 1000);
    monitor.recordSent(1, 1000000);
    monitor.recordSent(2, 1016000);

    EXPECT_DOUBLE_EQ(monitor.recordAck(1, 1010000), 10.0);
    EXPECT_DOUBLE_EQ(monitor.recordAck(2, 1046000), 30.0);

    NetworkStats s = monitor.stats();
    EXPECT_EQ(s.sent, 2u);
    EXPECT_EQ(s.acked, 2u);
    EXPECT_DOUBLE_EQ(s.avgRttMs, 20.0);
    EXPECT_DOUBLE_EQ(s.maxRttMs, 30.0);
    EXPECT_DOUBLE_EQ(s.lossRate, 0.0);
}

TEST(NetworkMonitor, UnknownOrRepeatedAckIsIgnored) {
    NetworkMonitor monitor(100, 1000);
    monitor.recordSent(1, 0);
    EXPECT_GE(monitor.recordAck(1, 5000), 0.0);
    EXPECT_LT(monitor.recordAck(1, 6000), 0.0);
    EXPECT_LT(monitor.recordAck(77, 6000), 0.0);
    EXPECT_EQ(monitor.stats().acked, 1u);
}

TEST(NetworkMonitor, LossIsTheUnackedFraction) {
    NetworkMonitor monitor(100, 1000);
    for (uint64_t seq = 1; seq <= 20; seq++) {
        monitor.recordSent(seq, (int64_t)seq * 1000);
    }
    for (uint64_t seq = 1; seq <= 15; seq++) {
        monitor.recordAck(seq, (int64_t)seq * 1000 + 2000);
    }
    EXPECT_NEAR(monitor.stats().lossRate, 0.25, 1e-9);
}

TEST(NetworkMonitor, OldPendingSendsArePruned) {
    NetworkMonitor monitor(100, 4);
    for (uint64_t seq = 1; seq <= 10; seq++) {
        monitor.recordSent(seq, 0);
    }
    EXPECT_LT(monitor.recordAck(1, 1000), 0.0);
    EXPECT_GE(monitor.recordAck(10, 1000), 0.0);
}

TEST(NetworkMonitor, RttWindowKeepsRecentSamples) {
    NetworkMonitor monitor(2, 100);
    monitor.recordSent(1, 0);
    monitor.recordSent(2, 0);
    monitor.recordSent(3, 0);
    monitor.recordAck(1, 100000);   // 100 ms, falls out of the window
    monitor.recordAck(2, 10000);
    monitor.recordAck(3, 20000);
    NetworkStats s = monitor.stats();
    EXPECT_DOUBLE_EQ(s.avgRttMs, 15.0);
    EXPECT_DOUBLE_EQ(s.maxRttMs, 20.0);

    monitor.reset();
    EXPECT_EQ(monitor.stats().sent, 0u);
}
