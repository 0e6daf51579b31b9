#pragma once

// =============================================================================
// Relay Follower Module
// =============================================================================
// Follower host side of network mirroring. Telemetry received on the relay
// io thread is queued with its receipt time; the control loop drains the
// queue once per cycle and for each message, in arrival order:
//
//   1. estimates one-way latency: receipt wall clock - capture timestamp,
//      else half the leader-reported RTT, else unknown (accepted, counted)
//   2. drops it if seq <= last applied (stale / out of order)
//   3. drops it if latency > max (default 200 ms); a run of such drops
//      raises a warning but never stops the loop
//   4. smooths each joint toward its target and limits the step size
//   5. writes to the mapped follower arm, records the sequence, acks
//
// A new leader session (restarted leader) resets the sequence guard; late
// messages from a retired session are dropped as stale.
//
// Usage:
//   RelayFollower follower(roles.followers, table, remaps, transport, config);
//   if (!follower.begin()) { ... }
//   follower.run(stopFlag, 0.0);
// =============================================================================

#include "mapping_table.h"
#include "motor_channel.h"
#include "position_smoother.h"
#include "relay_protocol.h"
#include "relay_transport.h"

#include <ArduinoJson.h>

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class DisplayManager;

enum class TelemetryVerdict {
    APPLY,
    OUT_OF_ORDER,       // seq <= last applied, or retired session
    LATENCY_EXCEEDED
};

const char* verdictName(TelemetryVerdict verdict);

// Sequence and latency guard
class TelemetryGate {
public:
    TelemetryGate(double maxLatencyMs, int dropWarnRun);

    // latencyMs < 0 means unknown (accepted).
    TelemetryVerdict check(uint64_t sequence, double latencyMs);

    // Count a message from a retired session as stale
    TelemetryVerdict rejectStale();

    // Record an applied sequence. Skipped numbers since the last applied
    // one in this session count as gapped.
    void accept(uint64_t sequence);

    // Forget the last applied sequence (new leader session)
    void resetSequence();

    bool hasApplied() const { return _hasApplied; }
    uint64_t lastApplied() const { return _lastApplied; }
    uint64_t droppedStale() const { return _droppedStale; }
    uint64_t droppedLate() const { return _droppedLate; }
    uint64_t unestimated() const { return _unestimated; }
    uint64_t gapped() const { return _gapped; }
    int consecutiveLate() const { return _consecutiveLate; }
    double maxLatencyMs() const { return _maxLatencyMs; }

    // Over the last RELAY_LATENCY_SAMPLES estimated latencies; -1 if none
    double latencyAvgMs() const;
    double latencyPeakMs() const;

private:
    double _maxLatencyMs;
    int _dropWarnRun;
    bool _hasApplied = false;
    uint64_t _lastApplied = 0;
    uint64_t _droppedStale = 0;
    uint64_t _droppedLate = 0;
    uint64_t _unestimated = 0;
    uint64_t _gapped = 0;
    int _consecutiveLate = 0;
    std::deque<double> _latencies;
};

struct RelayFollowerConfig {
    std::string nodeId = "follower";
    int fps = 60;
    double maxLatencyMs = 200.0;
    double smoothing = 0.8;
    int maxStep = 200;
    int dropWarnRun = 10;
    unsigned int statusIntervalMs = 2000;
    unsigned int statusTimeoutMs = 5000;
    unsigned int slowMs = 1000;
};

enum class PeerState {
    WAITING,        // Never heard from the leader
    CONNECTED,
    SLOW,
    DISCONNECTED
};

const char* peerStateName(PeerState state);

struct FollowerCounters {
    uint64_t applied = 0;
    uint64_t droppedStale = 0;
    uint64_t droppedLate = 0;
    uint64_t unestimated = 0;
    uint64_t gapped = 0;
    uint64_t writeFailures = 0;
    uint64_t lastSequence = 0;
    double lastLatencyMs = -1.0;
    double avgLatencyMs = -1.0;
    double maxLatencyMs = -1.0;
    PeerState peer = PeerState::WAITING;
};

class RelayFollower {
public:
    RelayFollower(const std::vector<MotorChannel*>& followers, MappingTable& table, RemapQueue& remaps,
                  RelayTransport& transport, const RelayFollowerConfig& config);

    // Seed smoothers from present positions, enable torque, subscribe and
    // start the transport.
    bool begin();

    // Relay io thread: queue a received message
    void onMessage(const std::string& channel, const std::string& payload, int64_t receivedUs);

    // Loop thread: apply remaps, then process queued messages in order.
    // Returns the number of messages processed.
    int drainInbox();

    TelemetryVerdict processTelemetry(const TelemetryMessage& msg, int64_t receivedUs);

    // Periodic status publish and leader liveness
    void poll(unsigned long nowMs);

    void run(const std::atomic<bool>& stopFlag, double durationSec);

    // Publish a disconnect, stop the transport and close the channels.
    void end();

    void setDisplay(DisplayManager* display) { _display = display; }

    PeerState peerState(unsigned long nowMs) const;
    const TelemetryGate& gate() const { return _gate; }
    uint64_t applied() const { return _applied; }
    PositionMap lastCommanded(const std::string& followerLabel) const;

    // Thread-safe copy, refreshed by the loop
    FollowerCounters counters() const;

    void fillStatus(JsonObject out) const;

private:
    struct InboxItem {
        std::string channel;
        std::string payload;
        int64_t receivedUs;
    };

    std::vector<MotorChannel*> _followers;
    MappingTable& _table;
    RemapQueue& _remaps;
    RelayTransport& _transport;
    RelayFollowerConfig _config;
    DisplayManager* _display = nullptr;

    std::mutex _inboxMutex;
    std::deque<InboxItem> _inbox;
    uint64_t _inboxOverflow = 0;

    // Loop thread state
    TelemetryGate _gate;
    std::map<std::string, PositionSmoother> _smoothers;     // per follower label
    bool _hasSession = false;
    uint32_t _session = 0;
    std::set<uint32_t> _retiredSessions;
    double _leaderRttMs = -1.0;
    unsigned long _lastLeaderMs = 0;
    bool _leaderSeen = false;
    PeerState _reportedState = PeerState::WAITING;
    unsigned long _lastStatusMs = 0;
    uint64_t _applied = 0;
    uint64_t _writeFailures = 0;
    bool _ended = false;

    double _lastLatencyMs = -1.0;

    mutable std::mutex _stateMutex;     // guards the copies below for status readers
    std::map<std::string, PositionMap> _commanded;
    FollowerCounters _counters;

    MotorChannel* findFollower(const std::string& label) const;
    void seedMissing(MotorChannel* follower, PositionSmoother& smoother, const PositionMap& targets);
    void handleStatusChannel(const std::string& payload);
    void sendAck(const TelemetryMessage& msg);
    void publishStatus(unsigned long nowMs);
    void renderDisplay();
    void updateCounters(unsigned long nowMs);
};
