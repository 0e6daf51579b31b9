// =============================================================================
// Log levels and the log ring
// =============================================================================

#include "debug_log.h"

#include <gtest/gtest.h>

#include <cstring>

TEST(DebugLog, ParsesLevelNames) {
    EXPECT_EQ(debugLogParseLevel("error"), LOG_LEVEL_ERROR);
    EXPECT_EQ(debugLogParseLevel("WARN"), LOG_LEVEL_WARN);
    EXPECT_EQ(debugLogParseLevel("warning"), LOG_LEVEL_WARN);
    EXPECT_EQ(debugLogParseLevel("Info"), LOG_LEVEL_INFO);
    EXPECT_EQ(debugLogParseLevel("debug"), LOG_LEVEL_DEBUG);
    EXPECT_EQ(debugLogParseLevel("none"), LOG_LEVEL_NONE);
    EXPECT_EQ(debugLogParseLevel("loud"), -1);
    EXPECT_EQ(debugLogParseLevel(nullptr), -1);
}

TEST(DebugLog, RingKeepsLinesInOrder) {
    debugLogSetLevel(LOG_LEVEL_INFO);
    uint32_t head = logRingGetHead();
    LOG_INFO("Test", "first %d", 1);
    LOG_WARN("Test", "second");

    LogEntry entries[8];
    int n = logRingGetSince(head, entries, 8);
    ASSERT_EQ(n, 2);
    EXPECT_EQ(entries[0].seq, head);
    EXPECT_EQ(entries[1].seq, head + 1);
    EXPECT_NE(strstr(entries[0].text, "first 1"), nullptr);
    EXPECT_NE(strstr(entries[1].text, "WARN"), nullptr);
    EXPECT_EQ(logRingGetHead(), head + 2);
}

TEST(DebugLog, LevelFiltersMessages) {
    debugLogSetLevel(LOG_LEVEL_WARN);
    uint32_t head = logRingGetHead();
    LOG_INFO("Test", "hidden");
    LOG_DEBUG("Test", "hidden too");
    EXPECT_EQ(logRingGetHead(), head);
    LOG_ERROR("Test", "shown");
    EXPECT_EQ(logRingGetHead(), head + 1);
    debugLogSetLevel(LOG_LEVEL_INFO);
}

TEST(DebugLog, SetLevelIsClamped) {
    debugLogSetLevel(99);
    EXPECT_EQ(debugLogGetLevel(), LOG_LEVEL_DEBUG);
    debugLogSetLevel(-3);
    EXPECT_EQ(debugLogGetLevel(), LOG_LEVEL_NONE);
    debugLogSetLevel(LOG_LEVEL_INFO);
}

TEST(DebugLog, OverwrittenEntriesAreSkipped) {
    debugLogSetLevel(LOG_LEVEL_INFO);
    debugLogSetConsole(false);
    uint32_t head = logRingGetHead();
    for (int i = 0; i < LOG_RING_SIZE + 10; i++) {
        LOG_INFO("Test", "line %d", i);
    }
    debugLogSetConsole(true);

    LogEntry entries[LOG_RING_SIZE];
    int n = logRingGetSince(head, entries, LOG_RING_SIZE);
    ASSERT_EQ(n, LOG_RING_SIZE);
    EXPECT_EQ(entries[0].seq, head + 10);
    EXPECT_NE(strstr(entries[n - 1].text, "line 73"), nullptr);
}

TEST(DebugLog, SmallBufferGetsTheNewestLines) {
    debugLogSetLevel(LOG_LEVEL_INFO);
    uint32_t head = logRingGetHead();
    for (int i = 0; i < 5; i++) {
        LOG_INFO("Test", "entry %d", i);
    }
    LogEntry entries[2];
    int n = logRingGetSince(head, entries, 2);
    ASSERT_EQ(n, 2);
    EXPECT_EQ(entries[1].seq, head + 4);
    EXPECT_EQ(logRingGetSince(logRingGetHead(), entries, 2), 0);
}

TEST(DebugLog, LongLinesAreTruncated) {
    debugLogSetLevel(LOG_LEVEL_INFO);
    uint32_t head = logRingGetHead();
    std::string big(400, 'x');
    LOG_INFO("Test", "%s", big.c_str());
    LogEntry entry;
    ASSERT_EQ(logRingGetSince(head, &entry, 1), 1);
    EXPECT_EQ(strlen(entry.text), (size_t)LOG_ENTRY_MAX_LEN - 1);
}
