// =============================================================================
// Relay Leader Module - Implementation
// =============================================================================

#include "relay_leader.h"
#include "config.h"
#include "debug_log.h"
#include "display_manager.h"
#include "loop_timer.h"

#include <chrono>
#include <future>
#include <random>

static const char* TAG = "Leader";

static uint32_t newSessionId() {
    std::random_device rd;
    uint32_t id = 0;
    while (id == 0) {
        id = rd();
    }
    return id;
}

RelayLeader::RelayLeader(const std::vector<MotorChannel*>& leaders, RelayTransport& transport,
                         const RelayLeaderConfig& config)
    : _leaders(leaders),
      _transport(transport),
      _config(config),
      _session(newSessionId()),
      _monitor(RELAY_RTT_SAMPLES, RELAY_PENDING_ACK_MAX) {
}

bool RelayLeader::begin() {
    _transport.subscribe(RELAY_CHANNEL_STATUS,
        [this](const std::string&, const std::string& payload) { handleStatusMessage(payload); });

    if (!_transport.begin()) {
        LOG_ERROR(TAG, "Relay transport failed to start");
        return false;
    }
    LOG_INFO(TAG, "Publishing %d arm(s) at %d Hz, session %08x",
             (int)_leaders.size(), _config.fps, _session);
    return true;
}

TelemetryMessage RelayLeader::buildTelemetry(const std::map<std::string, PositionMap>& positions, int64_t captureUs) {
    TelemetryMessage msg;
    msg.session = _session;
    msg.sequence = ++_sequence;
    msg.timestampUs = captureUs;
    msg.hasTimestamp = true;
    msg.positions = positions;
    return msg;
}

void RelayLeader::publishCycle() {
    int64_t captureUs = wallClockMicros();

    std::vector<std::future<PositionMap>> reads;
    for (MotorChannel* leader : _leaders) {
        reads.push_back(leader->readPositionsAsync());
    }

    std::map<std::string, PositionMap> positions;
    for (size_t i = 0; i < _leaders.size(); i++) {
        PositionMap got = reads[i].get();
        _readFailures += _leaders[i]->motorIds().size() - got.size();
        if (!got.empty()) {
            positions[_leaders[i]->label()] = got;
        }
    }
    if (positions.empty()) {
        return;
    }

    TelemetryMessage msg = buildTelemetry(positions, captureUs);
    if (_transport.publish(RELAY_CHANNEL_TELEMETRY, encodeTelemetry(msg))) {
        _monitor.recordSent(msg.sequence, captureUs);
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _lastPositions = positions;
}

void RelayLeader::poll(unsigned long nowMs) {
    // Follower liveness: log only, output continues. The io thread may
    // have stamped a time later than nowMs.
    unsigned long last = _lastFollowerMs;
    unsigned long age = last >= nowMs ? 0 : nowMs - last;
    if (_followerConnected && age > _config.statusTimeoutMs) {
        _followerConnected = false;
        LOG_WARN(TAG, "Follower disconnected (no status for %lu ms)", age);
    }

    if (nowMs - _lastStatusMs < _config.statusIntervalMs) {
        return;
    }
    _lastStatusMs = nowMs;
    publishStatus();

    NetworkStats net = _monitor.stats();
    if (net.avgRttMs >= 0.0 && net.avgRttMs / 2.0 > _config.latencyWarnMs) {
        LOG_WARN(TAG, "High latency: avg RTT %.1f ms (max %.1f ms)", net.avgRttMs, net.maxRttMs);
    }
    if (_followerConnected && net.sent >= 50 && net.lossRate > _config.lossWarn) {
        LOG_WARN(TAG, "Unacked telemetry %.1f%% (%llu of %llu)", net.lossRate * 100.0,
                 (unsigned long long)(net.sent - net.acked), (unsigned long long)net.sent);
    }
}

void RelayLeader::publishStatus() {
    NetworkStats net = _monitor.stats();
    StatusMessage status;
    status.role = "leader";
    status.nodeId = _config.nodeId;
    status.timestampUs = wallClockMicros();
    status.arms = (int)_leaders.size();
    int motors = 0;
    for (MotorChannel* leader : _leaders) {
        motors += (int)leader->motorIds().size();
    }
    status.motorsActive = motors;
    status.rttMs = net.avgRttMs;
    status.lossRate = net.lossRate;
    status.sent = net.sent;
    status.lastSequence = _sequence;
    status.peerState = _followerConnected ? "connected" : "disconnected";

    if (!_transport.publish(RELAY_CHANNEL_STATUS, encodeStatus(status))) {
        LOG_DEBUG(TAG, "Status publish skipped (transport down)");
    }
}

void RelayLeader::handleStatusMessage(const std::string& payload) {
    switch (peekMessageType(payload)) {
        case MessageType::ACK: {
            AckMessage ack;
            if (!decodeAck(payload, ack) || ack.session != _session) {
                return;
            }
            double rtt = _monitor.recordAck(ack.sequence, wallClockMicros());
            if (rtt >= 0.0) {
                LOG_DEBUG(TAG, "ack seq %llu rtt %.1f ms", (unsigned long long)ack.sequence, rtt);
            }
            break;
        }
        case MessageType::STATUS: {
            StatusMessage status;
            if (!decodeStatus(payload, status) || status.role != "follower") {
                return;
            }
            std::lock_guard<std::mutex> lock(_mutex);
            _lastFollowerStatus = status;
            break;
        }
        case MessageType::DISCONNECT: {
            DisconnectMessage bye;
            if (decodeDisconnect(payload, bye) && bye.role == "follower") {
                LOG_WARN(TAG, "Follower %s disconnected", bye.nodeId.c_str());
                _followerConnected = false;
            }
            return;
        }
        case MessageType::TELEMETRY:
        case MessageType::UNKNOWN:
            return;
    }

    _lastFollowerMs = logMillis();
    if (!_followerConnected) {
        _followerConnected = true;
        LOG_INFO(TAG, "Follower connected");
    }
}

void RelayLeader::run(const std::atomic<bool>& stopFlag, double durationSec) {
    LoopTimer timer(_config.fps);
    auto begin = std::chrono::steady_clock::now();

    while (!stopFlag) {
        if (durationSec > 0.0) {
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
            if (elapsed >= durationSec) {
                LOG_INFO(TAG, "Duration %.1fs reached", durationSec);
                break;
            }
        }

        publishCycle();
        poll(logMillis());
        renderDisplay();
        timer.waitNext();
    }

    end();
}

void RelayLeader::end() {
    if (_ended) {
        return;
    }
    _ended = true;

    DisconnectMessage bye;
    bye.role = "leader";
    bye.nodeId = _config.nodeId;
    bye.timestampUs = wallClockMicros();
    if (!_transport.publish(RELAY_CHANNEL_STATUS, encodeDisconnect(bye))) {
        LOG_DEBUG(TAG, "Disconnect not sent (transport down)");
    }
    _transport.end();

    for (MotorChannel* leader : _leaders) {
        leader->close();
    }

    NetworkStats net = _monitor.stats();
    LOG_INFO(TAG, "Stopped at seq %llu: %llu sent, %llu acked, avg RTT %.1f ms",
             (unsigned long long)_sequence.load(), (unsigned long long)net.sent,
             (unsigned long long)net.acked, net.avgRttMs);
}

void RelayLeader::renderDisplay() {
    if (_display == nullptr || !_display->due()) {
        return;
    }

    DisplayFrame frame;
    frame.title = "ArmMirror - relay leader";
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (MotorChannel* leader : _leaders) {
            ArmRow row;
            row.label = leader->label();
            row.positions = _lastPositions[leader->label()];
            row.resolution = leader->resolution();
            frame.arms.push_back(row);
        }
    }

    NetworkStats net = _monitor.stats();
    char line[160];
    snprintf(line, sizeof(line), "session %08x  seq %llu  relay %s  follower %s", _session,
             (unsigned long long)_sequence.load(), _transport.isConnected() ? "connected" : "offline",
             _followerConnected ? "connected" : "disconnected");
    frame.stats.push_back(line);
    snprintf(line, sizeof(line), "sent %llu  acked %llu  loss %.1f%%  rtt avg %.1f ms max %.1f ms",
             (unsigned long long)net.sent, (unsigned long long)net.acked, net.lossRate * 100.0,
             net.avgRttMs, net.maxRttMs);
    frame.stats.push_back(line);
    snprintf(line, sizeof(line), "read failures %llu", (unsigned long long)_readFailures.load());
    frame.stats.push_back(line);
    frame.hint = "[q] quit   Ctrl-C stop";

    _display->render(frame);
}

void RelayLeader::fillStatus(JsonObject out) const {
    NetworkStats net = _monitor.stats();
    out["mode"] = "leader";
    out["session"] = _session;
    out["sequence"] = _sequence.load();
    out["relayConnected"] = _transport.isConnected();
    out["followerConnected"] = _followerConnected.load();
    out["sent"] = net.sent;
    out["acked"] = net.acked;
    out["lossRate"] = net.lossRate;
    out["rttAvgMs"] = net.avgRttMs;
    out["rttMaxMs"] = net.maxRttMs;
    out["readFailures"] = _readFailures.load();

    std::lock_guard<std::mutex> lock(_mutex);
    JsonObject follower = out["follower"].to<JsonObject>();
    follower["node"] = _lastFollowerStatus.nodeId;
    follower["applied"] = _lastFollowerStatus.applied;
    follower["stale"] = _lastFollowerStatus.droppedStale;
    follower["late"] = _lastFollowerStatus.droppedLate;
    follower["gapped"] = _lastFollowerStatus.gapped;
    follower["latencyAvgMs"] = _lastFollowerStatus.latencyAvgMs;

    JsonObject arms = out["positions"].to<JsonObject>();
    for (const auto& arm : _lastPositions) {
        JsonObject joints = arms[arm.first].to<JsonObject>();
        for (const auto& joint : arm.second) {
            joints[std::to_string(joint.first)] = joint.second;
        }
    }
}
