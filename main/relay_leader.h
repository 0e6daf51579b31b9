#pragma once

// =============================================================================
// Relay Leader Module
// =============================================================================
// Leader host side of network mirroring. At a fixed rate it reads every
// leader arm, stamps the sample with the next sequence number and the
// wall-clock capture time, and publishes it fire-and-forget on the
// telemetry channel. It never waits for acks; a follower that falls behind
// is protected by its own latency and sequence guards.
//
// On the status channel it publishes its own status every 2s, feeds follower
// acks into the NetworkMonitor (RTT / loss) and tracks follower liveness.
// Missing follower status only changes the logged/displayed state.
//
// Usage:
//   RelayLeader leader(roles.leaders, transport, config);
//   if (!leader.begin()) { ... transport failure ... }
//   leader.run(stopFlag, 0.0);        // Sends disconnect and closes on exit
// =============================================================================

#include "motor_channel.h"
#include "network_monitor.h"
#include "relay_protocol.h"
#include "relay_transport.h"

#include <ArduinoJson.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class DisplayManager;

struct RelayLeaderConfig {
    std::string nodeId = "leader";
    int fps = 60;
    unsigned int statusIntervalMs = 2000;
    unsigned int statusTimeoutMs = 5000;
    double latencyWarnMs = 100.0;
    double lossWarn = 0.05;
};

class RelayLeader {
public:
    RelayLeader(const std::vector<MotorChannel*>& leaders, RelayTransport& transport,
                const RelayLeaderConfig& config);

    // Subscribe to the status channel and start the transport.
    bool begin();

    // Stamp positions with the next sequence number and capture time.
    TelemetryMessage buildTelemetry(const std::map<std::string, PositionMap>& positions, int64_t captureUs);

    // Read all leaders in parallel and publish one telemetry message.
    void publishCycle();

    // Periodic status publish and follower liveness (call every cycle).
    void poll(unsigned long nowMs);

    void run(const std::atomic<bool>& stopFlag, double durationSec);

    // Publish a disconnect, stop the transport and close the channels.
    void end();

    // Status channel handler (relay io thread)
    void handleStatusMessage(const std::string& payload);

    void setDisplay(DisplayManager* display) { _display = display; }

    uint32_t session() const { return _session; }
    uint64_t lastSequence() const { return _sequence; }
    bool followerConnected() const { return _followerConnected; }
    NetworkStats networkStats() const { return _monitor.stats(); }

    void fillStatus(JsonObject out) const;

private:
    std::vector<MotorChannel*> _leaders;
    RelayTransport& _transport;
    RelayLeaderConfig _config;
    DisplayManager* _display = nullptr;

    uint32_t _session;
    std::atomic<uint64_t> _sequence{0};
    NetworkMonitor _monitor;
    std::atomic<uint64_t> _readFailures{0};
    bool _ended = false;

    // Follower liveness (written on io thread, read by the loop)
    std::atomic<unsigned long> _lastFollowerMs{0};
    std::atomic<bool> _followerConnected{false};

    mutable std::mutex _mutex;
    StatusMessage _lastFollowerStatus;
    std::map<std::string, PositionMap> _lastPositions;

    unsigned long _lastStatusMs = 0;

    void publishStatus();
    void renderDisplay();
};
