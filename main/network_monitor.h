#pragma once

// =============================================================================
// Network Monitor
// =============================================================================
// Leader-side link quality: matches follower acks to published sequence
// numbers to measure round-trip time and the unacked fraction. Thread-safe
// (sends are recorded by the loop, acks arrive on the relay io thread).
// =============================================================================

#include <stdint.h>
#include <deque>
#include <map>
#include <mutex>

struct NetworkStats {
    uint64_t sent = 0;
    uint64_t acked = 0;
    double avgRttMs = -1.0;     // <0 = no samples yet
    double maxRttMs = -1.0;
    double lossRate = 0.0;      // 1 - acked/sent
};

class NetworkMonitor {
public:
    NetworkMonitor(size_t rttSamples, size_t maxPending);

    void recordSent(uint64_t sequence, int64_t sentUs);

    // Returns the RTT in ms, or -1 if the sequence is unknown (already
    // acked, pruned, or from another session).
    double recordAck(uint64_t sequence, int64_t nowUs);

    NetworkStats stats() const;
    void reset();

private:
    size_t _rttSamples;
    size_t _maxPending;

    mutable std::mutex _mutex;
    std::map<uint64_t, int64_t> _pending;   // seq -> sent time
    std::deque<double> _rtts;
    uint64_t _sent = 0;
    uint64_t _acked = 0;
};
