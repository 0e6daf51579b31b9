#pragma once

// =============================================================================
// Relay Protocol Messages
// =============================================================================
// Messages exchanged between the relay leader and follower, MessagePack-
// encoded with ArduinoJson. Every message carries a "type" key.
//
//   telemetry  leader -> follower   robot-telemetry
//              { type, session, seq, ts, positions: { "Leader1": { "1": 2048, ... } } }
//   ack        follower -> leader   robot-status
//              { type, seq, ts (echo of capture time), node }
//   status     both directions      robot-status   (every 2s)
//              { type, role, node, ts, arms, motors, rtt, sent, applied, stale, late, ... }
//   disconnect both directions      robot-status   (on shutdown)
//              { type, role, node, ts }
//
// Timestamps are wall-clock microseconds since the Unix epoch. Sequence
// numbers are monotonic within one leader session (random 32-bit id).
// =============================================================================

#include "motor_channel.h"

#include <stdint.h>
#include <map>
#include <string>

enum class MessageType {
    UNKNOWN,
    TELEMETRY,
    ACK,
    STATUS,
    DISCONNECT
};

struct TelemetryMessage {
    uint32_t session = 0;
    uint64_t sequence = 0;
    bool hasTimestamp = true;
    int64_t timestampUs = 0;                            // Capture time
    std::map<std::string, PositionMap> positions;       // Leader label -> joints
};

struct AckMessage {
    uint32_t session = 0;
    uint64_t sequence = 0;
    int64_t timestampUs = 0;        // Echo of the telemetry capture time
    std::string nodeId;
};

struct StatusMessage {
    std::string role;               // "leader" / "follower"
    std::string nodeId;
    int64_t timestampUs = 0;
    int arms = 0;
    int motorsActive = 0;
    double rttMs = -1.0;            // Leader's average RTT; <0 = unknown
    double lossRate = 0.0;          // Leader: unacked fraction
    uint64_t sent = 0;              // Leader: telemetry published
    uint64_t applied = 0;           // Follower: telemetry applied
    uint64_t droppedStale = 0;      // Follower: out-of-order / retired session
    uint64_t droppedLate = 0;       // Follower: over max latency
    uint64_t gapped = 0;            // Follower: sequence numbers never applied
    double latencyAvgMs = -1.0;     // Follower: recent one-way latency; <0 = none
    double latencyMaxMs = -1.0;
    uint64_t lastSequence = 0;
    std::string peerState;          // Follower: leader liveness
};

struct DisconnectMessage {
    std::string role;
    std::string nodeId;
    int64_t timestampUs = 0;
};

const char* messageTypeName(MessageType type);

// Wall clock in microseconds since the Unix epoch
int64_t wallClockMicros();

// Read just the "type" key. UNKNOWN if undecodable.
MessageType peekMessageType(const std::string& bytes);

std::string encodeTelemetry(const TelemetryMessage& msg);
std::string encodeAck(const AckMessage& msg);
std::string encodeStatus(const StatusMessage& msg);
std::string encodeDisconnect(const DisconnectMessage& msg);

bool decodeTelemetry(const std::string& bytes, TelemetryMessage& out);
bool decodeAck(const std::string& bytes, AckMessage& out);
bool decodeStatus(const std::string& bytes, StatusMessage& out);
bool decodeDisconnect(const std::string& bytes, DisconnectMessage& out);
