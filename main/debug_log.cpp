// =============================================================================
// Debug Logging Module - Implementation
// =============================================================================

#include "debug_log.h"
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

#include <atomic>
#include <chrono>
#include <mutex>

static const char* levelNames[] = {
    "NONE",   // 0
    "ERROR",  // 1
    "WARN",   // 2
    "INFO",   // 3
    "DEBUG"   // 4
};

static std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();
static std::atomic<int> s_runtimeLevel(LOG_LEVEL_DEFAULT);
static std::atomic<bool> s_consoleEnabled(true);

// ---------------------------------------------------------------------------
// Ring buffer for display / HTTP log streaming
// ---------------------------------------------------------------------------
static std::mutex s_ringMutex;
static LogEntry s_ring[LOG_RING_SIZE];
static uint32_t s_ringSeq = 0;              // Next sequence number to assign
static int s_ringWriteIdx = 0;              // Next slot to write into

void debugLogInit(int runtimeLevel) {
    s_start = std::chrono::steady_clock::now();
    debugLogSetLevel(runtimeLevel);

    fprintf(stderr, "\n");
    fprintf(stderr, "========================================\n");
    fprintf(stderr, "  ArmMirror - Leader/Follower Arm Mirror\n");
    fprintf(stderr, "  Feetech STS serial bus\n");
    fprintf(stderr, "========================================\n");
    fprintf(stderr, "Log level: %s (%d)\n", levelNames[debugLogGetLevel()], debugLogGetLevel());
    fprintf(stderr, "\n");
}

void debugLogSetLevel(int level) {
    if (level < LOG_LEVEL_NONE) { level = LOG_LEVEL_NONE; }
    if (level > LOG_LEVEL_DEBUG) { level = LOG_LEVEL_DEBUG; }
    s_runtimeLevel = level;
}

int debugLogGetLevel() {
    return s_runtimeLevel;
}

int debugLogParseLevel(const char* name) {
    if (name == nullptr) {
        return -1;
    }
    for (int i = LOG_LEVEL_NONE; i <= LOG_LEVEL_DEBUG; i++) {
        if (strcasecmp(name, levelNames[i]) == 0) {
            return i;
        }
    }
    if (strcasecmp(name, "warning") == 0) {
        return LOG_LEVEL_WARN;
    }
    return -1;
}

void debugLogSetConsole(bool enabled) {
    s_consoleEnabled = enabled;
}

unsigned long logMillis() {
    return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - s_start).count();
}

void debugLog(int level, const char* tag, const char* format, ...) {
    if (level > LOG_LEVEL || level > s_runtimeLevel || level <= LOG_LEVEL_NONE) {
        return;
    }

    // Format: [millis] LEVEL [TAG] message
    char buffer[256];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    char fullLine[LOG_ENTRY_MAX_LEN];
    snprintf(fullLine, sizeof(fullLine), "[%8lu] %-5s [%-10s] %s",
             logMillis(), levelNames[level], tag, buffer);

    std::lock_guard<std::mutex> lock(s_ringMutex);

    if (s_consoleEnabled) {
        fprintf(stderr, "%s\n", fullLine);
    }

    LogEntry& entry = s_ring[s_ringWriteIdx];
    entry.seq = s_ringSeq;
    strncpy(entry.text, fullLine, LOG_ENTRY_MAX_LEN - 1);
    entry.text[LOG_ENTRY_MAX_LEN - 1] = '\0';
    s_ringSeq = s_ringSeq + 1;
    s_ringWriteIdx = (s_ringWriteIdx + 1) % LOG_RING_SIZE;
}

uint32_t logRingGetHead() {
    std::lock_guard<std::mutex> lock(s_ringMutex);
    return s_ringSeq;
}

int logRingGetSince(uint32_t afterSeq, LogEntry* outBuf, int maxEntries) {
    if (maxEntries <= 0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(s_ringMutex);

    if (s_ringSeq <= afterSeq) {
        return 0;
    }

    // Can't return more than the ring holds
    uint32_t available = s_ringSeq - afterSeq;
    if (available > LOG_RING_SIZE) {
        afterSeq = s_ringSeq - LOG_RING_SIZE;
        available = LOG_RING_SIZE;
    }
    // Can't return more than the caller's buffer: keep the most recent
    if (available > (uint32_t)maxEntries) {
        afterSeq = s_ringSeq - maxEntries;
    }

    int count = 0;
    for (uint32_t seq = afterSeq; seq < s_ringSeq && count < maxEntries; seq++) {
        // Entry `seq` lives at (writeIdx - (head - seq)) mod size
        int idx = (int)(s_ringWriteIdx - (int)(s_ringSeq - seq));
        while (idx < 0) { idx += LOG_RING_SIZE; }
        idx = idx % LOG_RING_SIZE;

        if (s_ring[idx].seq == seq) {
            outBuf[count] = s_ring[idx];
            count++;
        }
    }

    return count;
}
