#pragma once

// =============================================================================
// Debug Logging Module
// =============================================================================
// Severity-level logging to stderr with an in-memory ring buffer of the most
// recent lines (read by the terminal display and the /logs endpoint).
// Thread-safe: motor workers, the relay io thread and the control loop all log.
//
// Usage:
//   LOG_INFO("Relay", "Connected to %s:%u", host, port);
//   LOG_ERROR("Bus", "Open failed: %s", err.c_str());
// =============================================================================

#include <stdint.h>
#include "config.h"

// Log level definitions
#define LOG_LEVEL_NONE   0
#define LOG_LEVEL_ERROR  1
#define LOG_LEVEL_WARN   2
#define LOG_LEVEL_INFO   3
#define LOG_LEVEL_DEBUG  4

// Initialize the debug logging system (call once at startup)
void debugLogInit(int runtimeLevel);

// Runtime threshold; messages above it are dropped (still bounded by LOG_LEVEL)
void debugLogSetLevel(int level);
int debugLogGetLevel();

// Parse "error" / "warn" / "info" / "debug" / "none". Returns -1 if unknown.
int debugLogParseLevel(const char* name);

// Console echo on/off. The ring buffer is always written.
void debugLogSetConsole(bool enabled);

// Milliseconds since debugLogInit() (monotonic clock)
unsigned long logMillis();

// Core logging function - prefer the macros below
void debugLog(int level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

// ---------------------------------------------------------------------------
// Log ring buffer
// ---------------------------------------------------------------------------
#define LOG_RING_SIZE       64      // Number of entries in the ring buffer
#define LOG_ENTRY_MAX_LEN   160     // Max characters per log entry (truncated)

struct LogEntry {
    uint32_t seq;                           // Monotonic sequence number
    char text[LOG_ENTRY_MAX_LEN];           // Pre-formatted log line
};

// Returns the current sequence number (next entry to be written)
uint32_t logRingGetHead();

// Copy entries with seq >= afterSeq into outBuf (up to maxEntries).
// Returns number of entries copied. Entries are in chronological order.
int logRingGetSince(uint32_t afterSeq, LogEntry* outBuf, int maxEntries);

// Convenience macros with compile-time level filtering
#if LOG_LEVEL >= LOG_LEVEL_ERROR
  #define LOG_ERROR(tag, fmt, ...) debugLog(LOG_LEVEL_ERROR, tag, fmt, ##__VA_ARGS__)
#else
  #define LOG_ERROR(tag, fmt, ...) ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_WARN
  #define LOG_WARN(tag, fmt, ...)  debugLog(LOG_LEVEL_WARN, tag, fmt, ##__VA_ARGS__)
#else
  #define LOG_WARN(tag, fmt, ...)  ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_INFO
  #define LOG_INFO(tag, fmt, ...)  debugLog(LOG_LEVEL_INFO, tag, fmt, ##__VA_ARGS__)
#else
  #define LOG_INFO(tag, fmt, ...)  ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_DEBUG
  #define LOG_DEBUG(tag, fmt, ...) debugLog(LOG_LEVEL_DEBUG, tag, fmt, ##__VA_ARGS__)
#else
  #define LOG_DEBUG(tag, fmt, ...) ((void)0)
#endif
