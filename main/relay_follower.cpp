// =============================================================================
// Relay Follower Module - Implementation
// =============================================================================

#include "relay_follower.h"
#include "config.h"
#include "debug_log.h"
#include "display_manager.h"
#include "loop_timer.h"
#include "mirror_loop.h"

#include <algorithm>
#include <chrono>
#include <future>

static const char* TAG = "Follower";

static const size_t INBOX_MAX = 1000;
static const size_t RETIRED_SESSIONS_MAX = 16;

const char* verdictName(TelemetryVerdict verdict) {
    switch (verdict) {
        case TelemetryVerdict::APPLY:            return "apply";
        case TelemetryVerdict::OUT_OF_ORDER:     return "out-of-order";
        case TelemetryVerdict::LATENCY_EXCEEDED: return "latency-exceeded";
    }
    return "?";
}

const char* peerStateName(PeerState state) {
    switch (state) {
        case PeerState::WAITING:      return "waiting";
        case PeerState::CONNECTED:    return "connected";
        case PeerState::SLOW:         return "slow";
        case PeerState::DISCONNECTED: return "disconnected";
    }
    return "?";
}

// =============================================================================
// TelemetryGate
// =============================================================================

TelemetryGate::TelemetryGate(double maxLatencyMs, int dropWarnRun)
    : _maxLatencyMs(maxLatencyMs),
      _dropWarnRun(dropWarnRun > 0 ? dropWarnRun : 1) {
}

TelemetryVerdict TelemetryGate::check(uint64_t sequence, double latencyMs) {
    if (_hasApplied && sequence <= _lastApplied) {
        _droppedStale++;
        return TelemetryVerdict::OUT_OF_ORDER;
    }

    if (latencyMs >= 0.0) {
        _latencies.push_back(latencyMs);
        if (_latencies.size() > (size_t)RELAY_LATENCY_SAMPLES) {
            _latencies.pop_front();
        }
    }

    if (latencyMs < 0.0) {
        _unestimated++;
    } else if (latencyMs > _maxLatencyMs) {
        _droppedLate++;
        _consecutiveLate++;
        if (_consecutiveLate % _dropWarnRun == 0) {
            LOG_WARN(TAG, "%d consecutive messages over %.0f ms latency dropped (last %.0f ms)",
                     _consecutiveLate, _maxLatencyMs, latencyMs);
        }
        return TelemetryVerdict::LATENCY_EXCEEDED;
    }

    if (_consecutiveLate >= _dropWarnRun) {
        LOG_INFO(TAG, "Latency back under %.0f ms after %d drops", _maxLatencyMs, _consecutiveLate);
    }
    _consecutiveLate = 0;
    return TelemetryVerdict::APPLY;
}

TelemetryVerdict TelemetryGate::rejectStale() {
    _droppedStale++;
    return TelemetryVerdict::OUT_OF_ORDER;
}

void TelemetryGate::accept(uint64_t sequence) {
    if (_hasApplied && sequence > _lastApplied + 1) {
        _gapped += sequence - _lastApplied - 1;
    }
    _hasApplied = true;
    _lastApplied = sequence;
}

double TelemetryGate::latencyAvgMs() const {
    if (_latencies.empty()) {
        return -1.0;
    }
    double sum = 0.0;
    for (double ms : _latencies) {
        sum += ms;
    }
    return sum / _latencies.size();
}

double TelemetryGate::latencyPeakMs() const {
    if (_latencies.empty()) {
        return -1.0;
    }
    return *std::max_element(_latencies.begin(), _latencies.end());
}

void TelemetryGate::resetSequence() {
    _hasApplied = false;
    _lastApplied = 0;
}

// =============================================================================
// RelayFollower
// =============================================================================

RelayFollower::RelayFollower(const std::vector<MotorChannel*>& followers, MappingTable& table, RemapQueue& remaps,
                             RelayTransport& transport, const RelayFollowerConfig& config)
    : _followers(followers),
      _table(table),
      _remaps(remaps),
      _transport(transport),
      _config(config),
      _gate(config.maxLatencyMs, config.dropWarnRun) {
    for (MotorChannel* follower : _followers) {
        _smoothers.insert(std::make_pair(follower->label(), PositionSmoother(config.smoothing, config.maxStep)));
    }
}

bool RelayFollower::begin() {
    // Start every smoother from where the arm actually is
    for (MotorChannel* follower : _followers) {
        PositionMap present = follower->readPositions();
        auto it = _smoothers.find(follower->label());
        if (it != _smoothers.end()) {
            it->second.seed(present);
        }
        if (present.size() != follower->motorIds().size()) {
            LOG_WARN(TAG, "%s: %d of %d joints readable at start", follower->label().c_str(),
                     (int)present.size(), (int)follower->motorIds().size());
        }
        std::lock_guard<std::mutex> lock(_stateMutex);
        _commanded[follower->label()] = present;
    }

    for (MotorChannel* follower : _followers) {
        if (!follower->enableTorque()) {
            LOG_WARN(TAG, "%s: torque enable incomplete", follower->label().c_str());
        }
    }

    RelayTransport::MessageHandler handler = [this](const std::string& channel, const std::string& payload) {
        onMessage(channel, payload, wallClockMicros());
    };
    _transport.subscribe(RELAY_CHANNEL_TELEMETRY, handler);
    _transport.subscribe(RELAY_CHANNEL_STATUS, handler);

    if (!_transport.begin()) {
        LOG_ERROR(TAG, "Relay transport failed to start");
        return false;
    }

    LOG_INFO(TAG, "Following at %d Hz: max latency %.0f ms, smoothing %.2f, max step %d, mapping %s",
             _config.fps, _config.maxLatencyMs, _config.smoothing, _config.maxStep, _table.describe().c_str());
    return true;
}

void RelayFollower::onMessage(const std::string& channel, const std::string& payload, int64_t receivedUs) {
    std::lock_guard<std::mutex> lock(_inboxMutex);
    if (_inbox.size() >= INBOX_MAX) {
        _inbox.pop_front();
        _inboxOverflow++;
    }
    _inbox.push_back(InboxItem{channel, payload, receivedUs});
}

int RelayFollower::drainInbox() {
    _remaps.drainInto(_table);

    std::deque<InboxItem> items;
    {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        items.swap(_inbox);
    }

    for (const InboxItem& item : items) {
        if (item.channel == RELAY_CHANNEL_TELEMETRY) {
            TelemetryMessage msg;
            if (decodeTelemetry(item.payload, msg)) {
                processTelemetry(msg, item.receivedUs);
            } else {
                LOG_DEBUG(TAG, "Undecodable telemetry (%d bytes)", (int)item.payload.size());
            }
        } else if (item.channel == RELAY_CHANNEL_STATUS) {
            handleStatusChannel(item.payload);
        }
    }
    return (int)items.size();
}

MotorChannel* RelayFollower::findFollower(const std::string& label) const {
    for (MotorChannel* follower : _followers) {
        if (follower->label() == label) {
            return follower;
        }
    }
    return nullptr;
}

TelemetryVerdict RelayFollower::processTelemetry(const TelemetryMessage& msg, int64_t receivedUs) {
    _lastLeaderMs = logMillis();
    _leaderSeen = true;

    // Session bookkeeping: a restarted leader starts its sequence over
    if (!_hasSession || msg.session != _session) {
        if (_retiredSessions.count(msg.session) > 0) {
            return _gate.rejectStale();
        }
        if (_hasSession) {
            LOG_INFO(TAG, "New leader session %08x (was %08x), sequence reset", msg.session, _session);
            _retiredSessions.insert(_session);
            if (_retiredSessions.size() > RETIRED_SESSIONS_MAX) {
                _retiredSessions.erase(_retiredSessions.begin());
            }
        } else {
            LOG_INFO(TAG, "Leader session %08x", msg.session);
        }
        _session = msg.session;
        _hasSession = true;
        _gate.resetSequence();
    }

    // 1. Latency estimate
    double latencyMs = -1.0;
    if (msg.hasTimestamp) {
        latencyMs = (double)(receivedUs - msg.timestampUs) / 1000.0;
        if (latencyMs < 0.0) {
            latencyMs = 0.0;
        }
    } else if (_leaderRttMs >= 0.0) {
        latencyMs = _leaderRttMs / 2.0;
    }
    _lastLatencyMs = latencyMs;

    // 2-3. Sequence and latency guard
    TelemetryVerdict verdict = _gate.check(msg.sequence, latencyMs);
    if (verdict != TelemetryVerdict::APPLY) {
        LOG_DEBUG(TAG, "seq %llu dropped: %s (%.1f ms)", (unsigned long long)msg.sequence,
                  verdictName(verdict), latencyMs);
        return verdict;
    }

    // 4-5. Smooth, clamp, write to the mapped arm
    std::vector<MappingPair> pairs = _table.snapshot();
    std::vector<std::future<size_t>> writes;
    std::vector<size_t> expected;
    std::map<std::string, PositionMap> commanded;

    for (const MappingPair& pair : pairs) {
        auto source = msg.positions.find(pair.leader);
        MotorChannel* follower = findFollower(pair.follower);
        if (source == msg.positions.end() || follower == nullptr) {
            continue;
        }

        PositionMap targets;
        for (const auto& joint : source->second) {
            // Only joints this arm actually has
            for (uint8_t id : follower->motorIds()) {
                if (id == joint.first) {
                    targets[joint.first] = joint.second;
                    break;
                }
            }
        }

        PositionSmoother& smoother = _smoothers.at(pair.follower);
        if (!smoother.unseeded(targets).empty()) {
            seedMissing(follower, smoother, targets);
        }
        PositionMap smoothed = MirrorLoop::clampPositions(smoother.smooth(targets), follower->resolution(), nullptr);
        commanded[pair.follower] = smoothed;
        expected.push_back(smoothed.size());
        writes.push_back(follower->writePositionsAsync(smoothed));
    }

    for (size_t i = 0; i < writes.size(); i++) {
        size_t written = writes[i].get();
        _writeFailures += expected[i] - written;
    }

    _gate.accept(msg.sequence);
    _applied++;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        for (const auto& entry : commanded) {
            _commanded[entry.first] = entry.second;
        }
    }

    sendAck(msg);
    return verdict;
}

// Joints unreadable at begin() get their present position before they move
void RelayFollower::seedMissing(MotorChannel* follower, PositionSmoother& smoother, const PositionMap& targets) {
    std::vector<uint8_t> missing = smoother.unseeded(targets);
    PositionMap present = follower->readPositions();
    PositionMap found;
    for (uint8_t id : missing) {
        auto it = present.find(id);
        if (it != present.end()) {
            found[id] = it->second;
        } else {
            LOG_DEBUG(TAG, "%s id %d: no present position, holding", follower->label().c_str(), id);
        }
    }
    if (!found.empty()) {
        smoother.seed(found);
        LOG_INFO(TAG, "%s: seeded %d joint(s) from present position", follower->label().c_str(), (int)found.size());
    }
}

void RelayFollower::sendAck(const TelemetryMessage& msg) {
    AckMessage ack;
    ack.session = msg.session;
    ack.sequence = msg.sequence;
    ack.timestampUs = msg.timestampUs;
    ack.nodeId = _config.nodeId;
    if (!_transport.publish(RELAY_CHANNEL_STATUS, encodeAck(ack))) {
        LOG_DEBUG(TAG, "Ack for seq %llu not sent", (unsigned long long)msg.sequence);
    }
}

void RelayFollower::handleStatusChannel(const std::string& payload) {
    switch (peekMessageType(payload)) {
        case MessageType::STATUS: {
            StatusMessage status;
            if (!decodeStatus(payload, status) || status.role != "leader") {
                return;
            }
            _leaderRttMs = status.rttMs;
            _lastLeaderMs = logMillis();
            _leaderSeen = true;
            break;
        }
        case MessageType::DISCONNECT: {
            DisconnectMessage bye;
            if (decodeDisconnect(payload, bye) && bye.role == "leader") {
                LOG_WARN(TAG, "Leader %s disconnected; holding last position", bye.nodeId.c_str());
            }
            break;
        }
        case MessageType::ACK:
        case MessageType::TELEMETRY:
        case MessageType::UNKNOWN:
            break;
    }
}

PeerState RelayFollower::peerState(unsigned long nowMs) const {
    if (!_leaderSeen) {
        return PeerState::WAITING;
    }
    unsigned long last = _lastLeaderMs;
    unsigned long age = last >= nowMs ? 0 : nowMs - last;
    if (age < _config.slowMs) {
        return PeerState::CONNECTED;
    }
    if (age < _config.statusTimeoutMs) {
        return PeerState::SLOW;
    }
    return PeerState::DISCONNECTED;
}

void RelayFollower::poll(unsigned long nowMs) {
    PeerState state = peerState(nowMs);
    if (state != _reportedState) {
        if (state == PeerState::DISCONNECTED) {
            LOG_WARN(TAG, "Leader %s (no data for %lu ms)", peerStateName(state),
                     _lastLeaderMs >= nowMs ? 0UL : nowMs - _lastLeaderMs);
        } else {
            LOG_INFO(TAG, "Leader %s", peerStateName(state));
        }
        _reportedState = state;
    }

    if (nowMs - _lastStatusMs >= _config.statusIntervalMs) {
        _lastStatusMs = nowMs;
        publishStatus(nowMs);
    }
    updateCounters(nowMs);
}

void RelayFollower::publishStatus(unsigned long nowMs) {
    StatusMessage status;
    status.role = "follower";
    status.nodeId = _config.nodeId;
    status.timestampUs = wallClockMicros();
    status.arms = (int)_followers.size();
    int motors = 0;
    for (MotorChannel* follower : _followers) {
        motors += (int)follower->motorIds().size();
    }
    status.motorsActive = motors;
    status.applied = _applied;
    status.droppedStale = _gate.droppedStale();
    status.droppedLate = _gate.droppedLate();
    status.gapped = _gate.gapped();
    status.latencyAvgMs = _gate.latencyAvgMs();
    status.latencyMaxMs = _gate.latencyPeakMs();
    status.lastSequence = _gate.lastApplied();
    status.peerState = peerStateName(peerState(nowMs));
    if (!_transport.publish(RELAY_CHANNEL_STATUS, encodeStatus(status))) {
        LOG_DEBUG(TAG, "Status publish skipped (transport down)");
    }
}

void RelayFollower::updateCounters(unsigned long nowMs) {
    FollowerCounters c;
    c.applied = _applied;
    c.droppedStale = _gate.droppedStale();
    c.droppedLate = _gate.droppedLate();
    c.unestimated = _gate.unestimated();
    c.gapped = _gate.gapped();
    c.writeFailures = _writeFailures;
    c.lastSequence = _gate.lastApplied();
    c.lastLatencyMs = _lastLatencyMs;
    c.avgLatencyMs = _gate.latencyAvgMs();
    c.maxLatencyMs = _gate.latencyPeakMs();
    c.peer = peerState(nowMs);

    std::lock_guard<std::mutex> lock(_stateMutex);
    _counters = c;
}

FollowerCounters RelayFollower::counters() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _counters;
}

PositionMap RelayFollower::lastCommanded(const std::string& followerLabel) const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    auto it = _commanded.find(followerLabel);
    return it == _commanded.end() ? PositionMap() : it->second;
}

void RelayFollower::run(const std::atomic<bool>& stopFlag, double durationSec) {
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

        drainInbox();
        poll(logMillis());
        renderDisplay();
        timer.waitNext();
    }

    end();
}

void RelayFollower::end() {
    if (_ended) {
        return;
    }
    _ended = true;

    DisconnectMessage bye;
    bye.role = "follower";
    bye.nodeId = _config.nodeId;
    bye.timestampUs = wallClockMicros();
    if (!_transport.publish(RELAY_CHANNEL_STATUS, encodeDisconnect(bye))) {
        LOG_DEBUG(TAG, "Disconnect not sent (transport down)");
    }
    _transport.end();

    for (MotorChannel* follower : _followers) {
        follower->close();
    }

    if (_inboxOverflow > 0) {
        LOG_WARN(TAG, "%llu messages dropped on inbox overflow", (unsigned long long)_inboxOverflow);
    }
    LOG_INFO(TAG, "Stopped: applied %llu, stale %llu, late %llu, gapped %llu, unestimated %llu, write failures %llu",
             (unsigned long long)_applied, (unsigned long long)_gate.droppedStale(),
             (unsigned long long)_gate.droppedLate(), (unsigned long long)_gate.gapped(),
             (unsigned long long)_gate.unestimated(), (unsigned long long)_writeFailures);
    if (_gate.latencyAvgMs() >= 0.0) {
        LOG_INFO(TAG, "Latency over last %d: avg %.1f ms, max %.1f ms", RELAY_LATENCY_SAMPLES,
                 _gate.latencyAvgMs(), _gate.latencyPeakMs());
    }
}

void RelayFollower::renderDisplay() {
    if (_display == nullptr || !_display->due()) {
        return;
    }

    DisplayFrame frame;
    frame.title = "ArmMirror - relay follower";
    for (MotorChannel* follower : _followers) {
        ArmRow row;
        row.label = follower->label();
        row.positions = lastCommanded(follower->label());
        row.resolution = follower->resolution();
        frame.arms.push_back(row);
    }
    frame.mapping = _table.describe();

    FollowerCounters c = counters();
    char line[160];
    snprintf(line, sizeof(line), "leader %s  relay %s  last seq %llu  latency %.1f ms",
             peerStateName(c.peer), _transport.isConnected() ? "connected" : "offline",
             (unsigned long long)c.lastSequence, c.lastLatencyMs);
    frame.stats.push_back(line);
    snprintf(line, sizeof(line), "latency avg %.1f ms  max %.1f ms  gapped %llu",
             c.avgLatencyMs, c.maxLatencyMs, (unsigned long long)c.gapped);
    frame.stats.push_back(line);
    snprintf(line, sizeof(line), "applied %llu  stale %llu  late %llu  unestimated %llu  write failures %llu",
             (unsigned long long)c.applied, (unsigned long long)c.droppedStale,
             (unsigned long long)c.droppedLate, (unsigned long long)c.unestimated,
             (unsigned long long)c.writeFailures);
    frame.stats.push_back(line);
    frame.hint = "[s] swap pairs   [q] quit   Ctrl-C stop";

    _display->render(frame);
}

void RelayFollower::fillStatus(JsonObject out) const {
    FollowerCounters c = counters();
    out["mode"] = "follower";
    out["leader"] = peerStateName(c.peer);
    out["relayConnected"] = _transport.isConnected();
    out["applied"] = c.applied;
    out["droppedStale"] = c.droppedStale;
    out["droppedLate"] = c.droppedLate;
    out["unestimated"] = c.unestimated;
    out["gapped"] = c.gapped;
    out["writeFailures"] = c.writeFailures;
    out["lastSequence"] = c.lastSequence;
    out["latencyMs"] = c.lastLatencyMs;
    out["latencyAvgMs"] = c.avgLatencyMs;
    out["latencyMaxMs"] = c.maxLatencyMs;

    JsonArray mapping = out["mapping"].to<JsonArray>();
    for (const MappingPair& pair : _table.snapshot()) {
        JsonObject p = mapping.add<JsonObject>();
        p["leader"] = pair.leader;
        p["follower"] = pair.follower;
    }

    std::lock_guard<std::mutex> lock(_stateMutex);
    JsonObject arms = out["positions"].to<JsonObject>();
    for (const auto& arm : _commanded) {
        JsonObject joints = arms[arm.first].to<JsonObject>();
        for (const auto& joint : arm.second) {
            joints[std::to_string(joint.first)] = joint.second;
        }
    }
}
