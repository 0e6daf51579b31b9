// =============================================================================
// Relay Protocol Messages - MessagePack Codec
// =============================================================================

#include "relay_protocol.h"
#include "config.h"
#include "feetech_protocol.h"
#include "debug_log.h"

#include <ArduinoJson.h>

#include <chrono>

static const char* TAG = "Proto";

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::TELEMETRY:  return "telemetry";
        case MessageType::ACK:        return "ack";
        case MessageType::STATUS:     return "status";
        case MessageType::DISCONNECT: return "disconnect";
        case MessageType::UNKNOWN:    return "unknown";
    }
    return "unknown";
}

static MessageType typeFromName(const char* name) {
    if (name == nullptr) {
        return MessageType::UNKNOWN;
    }
    std::string s(name);
    if (s == "telemetry") { return MessageType::TELEMETRY; }
    if (s == "ack") { return MessageType::ACK; }
    if (s == "status") { return MessageType::STATUS; }
    if (s == "disconnect") { return MessageType::DISCONNECT; }
    return MessageType::UNKNOWN;
}

int64_t wallClockMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static bool parse(const std::string& bytes, JsonDocument& doc, MessageType expected) {
    DeserializationError err = deserializeMsgPack(doc, bytes.data(), bytes.size());
    if (err) {
        LOG_DEBUG(TAG, "Undecodable message (%d bytes): %s", (int)bytes.size(), err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>() || typeFromName(doc["type"] | "") != expected) {
        return false;
    }
    return true;
}

static std::string serialize(const JsonDocument& doc) {
    std::string out;
    serializeMsgPack(doc, out);
    return out;
}

MessageType peekMessageType(const std::string& bytes) {
    JsonDocument doc;
    DeserializationError err = deserializeMsgPack(doc, bytes.data(), bytes.size());
    if (err || !doc.is<JsonObject>()) {
        return MessageType::UNKNOWN;
    }
    return typeFromName(doc["type"] | "");
}

// ---------------------------------------------------------------------------
// Telemetry
// ---------------------------------------------------------------------------

std::string encodeTelemetry(const TelemetryMessage& msg) {
    JsonDocument doc;
    doc["type"] = "telemetry";
    doc["session"] = msg.session;
    doc["seq"] = msg.sequence;
    if (msg.hasTimestamp) {
        doc["ts"] = msg.timestampUs;
    }
    JsonObject positions = doc["positions"].to<JsonObject>();
    for (const auto& arm : msg.positions) {
        JsonObject joints = positions[arm.first].to<JsonObject>();
        for (const auto& joint : arm.second) {
            joints[std::to_string(joint.first)] = joint.second;
        }
    }
    return serialize(doc);
}

bool decodeTelemetry(const std::string& bytes, TelemetryMessage& out) {
    JsonDocument doc;
    if (!parse(bytes, doc, MessageType::TELEMETRY)) {
        return false;
    }
    if (!doc["seq"].is<uint64_t>() || !doc["positions"].is<JsonObject>()) {
        LOG_DEBUG(TAG, "Telemetry without seq/positions");
        return false;
    }

    TelemetryMessage msg;
    msg.session = doc["session"] | (uint32_t)0;
    msg.sequence = doc["seq"].as<uint64_t>();
    msg.hasTimestamp = doc["ts"].is<int64_t>();
    msg.timestampUs = msg.hasTimestamp ? doc["ts"].as<int64_t>() : 0;

    for (JsonPair arm : doc["positions"].as<JsonObject>()) {
        if (!arm.value().is<JsonObject>()) {
            return false;
        }
        PositionMap& joints = msg.positions[arm.key().c_str()];
        for (JsonPair joint : arm.value().as<JsonObject>()) {
            uint8_t id = 0;
            if (!feetechParseId(joint.key().c_str(), id) || !joint.value().is<int>()) {
                return false;
            }
            joints[id] = joint.value().as<int>();
        }
    }

    out = msg;
    return true;
}

// ---------------------------------------------------------------------------
// Ack
// ---------------------------------------------------------------------------

std::string encodeAck(const AckMessage& msg) {
    JsonDocument doc;
    doc["type"] = "ack";
    doc["session"] = msg.session;
    doc["seq"] = msg.sequence;
    doc["ts"] = msg.timestampUs;
    doc["node"] = msg.nodeId;
    return serialize(doc);
}

bool decodeAck(const std::string& bytes, AckMessage& out) {
    JsonDocument doc;
    if (!parse(bytes, doc, MessageType::ACK)) {
        return false;
    }
    if (!doc["seq"].is<uint64_t>()) {
        return false;
    }
    AckMessage msg;
    msg.session = doc["session"] | (uint32_t)0;
    msg.sequence = doc["seq"].as<uint64_t>();
    msg.timestampUs = doc["ts"] | (int64_t)0;
    msg.nodeId = doc["node"] | "";
    out = msg;
    return true;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

std::string encodeStatus(const StatusMessage& msg) {
    JsonDocument doc;
    doc["type"] = "status";
    doc["role"] = msg.role;
    doc["node"] = msg.nodeId;
    doc["ts"] = msg.timestampUs;
    doc["arms"] = msg.arms;
    doc["motors"] = msg.motorsActive;
    if (msg.rttMs >= 0.0) {
        doc["rtt"] = msg.rttMs;
    }
    doc["loss"] = msg.lossRate;
    doc["sent"] = msg.sent;
    doc["applied"] = msg.applied;
    doc["stale"] = msg.droppedStale;
    doc["late"] = msg.droppedLate;
    doc["gapped"] = msg.gapped;
    if (msg.latencyAvgMs >= 0.0) {
        doc["lat_avg"] = msg.latencyAvgMs;
        doc["lat_max"] = msg.latencyMaxMs;
    }
    doc["last_seq"] = msg.lastSequence;
    if (!msg.peerState.empty()) {
        doc["peer"] = msg.peerState;
    }
    return serialize(doc);
}

bool decodeStatus(const std::string& bytes, StatusMessage& out) {
    JsonDocument doc;
    if (!parse(bytes, doc, MessageType::STATUS)) {
        return false;
    }
    StatusMessage msg;
    msg.role = doc["role"] | "";
    msg.nodeId = doc["node"] | "";
    msg.timestampUs = doc["ts"] | (int64_t)0;
    msg.arms = doc["arms"] | 0;
    msg.motorsActive = doc["motors"] | 0;
    msg.rttMs = doc["rtt"] | -1.0;
    msg.lossRate = doc["loss"] | 0.0;
    msg.sent = doc["sent"] | (uint64_t)0;
    msg.applied = doc["applied"] | (uint64_t)0;
    msg.droppedStale = doc["stale"] | (uint64_t)0;
    msg.droppedLate = doc["late"] | (uint64_t)0;
    msg.gapped = doc["gapped"] | (uint64_t)0;
    msg.latencyAvgMs = doc["lat_avg"] | -1.0;
    msg.latencyMaxMs = doc["lat_max"] | -1.0;
    msg.lastSequence = doc["last_seq"] | (uint64_t)0;
    msg.peerState = doc["peer"] | "";
    out = msg;
    return true;
}

// ---------------------------------------------------------------------------
// Disconnect
// ---------------------------------------------------------------------------

std::string encodeDisconnect(const DisconnectMessage& msg) {
    JsonDocument doc;
    doc["type"] = "disconnect";
    doc["role"] = msg.role;
    doc["node"] = msg.nodeId;
    doc["ts"] = msg.timestampUs;
    return serialize(doc);
}

bool decodeDisconnect(const std::string& bytes, DisconnectMessage& out) {
    JsonDocument doc;
    if (!parse(bytes, doc, MessageType::DISCONNECT)) {
        return false;
    }
    DisconnectMessage msg;
    msg.role = doc["role"] | "";
    msg.nodeId = doc["node"] | "";
    msg.timestampUs = doc["ts"] | (int64_t)0;
    out = msg;
    return true;
}
