// =============================================================================
// Mirror Loop Module - Implementation
// =============================================================================

#include "mirror_loop.h"
#include "config.h"
#include "debug_log.h"
#include "display_manager.h"
#include "loop_timer.h"

#include <chrono>
#include <future>

static const char* TAG = "Mirror";

const char* loopStateName(LoopState state) {
    switch (state) {
        case LoopState::IDLE:    return "idle";
        case LoopState::RUNNING: return "running";
        case LoopState::STOPPED: return "stopped";
    }
    return "?";
}

MirrorLoop::MirrorLoop(const std::vector<MotorChannel*>& leaders,
                       const std::vector<MotorChannel*>& followers,
                       MappingTable& table, RemapQueue& remaps)
    : _leaders(leaders),
      _followers(followers),
      _table(table),
      _remaps(remaps) {
}

PositionMap MirrorLoop::clampPositions(const PositionMap& positions, int resolution, uint32_t* clampedCount) {
    PositionMap out;
    int maxValue = resolution - 1;
    for (const auto& entry : positions) {
        int value = entry.second;
        if (value < 0) {
            value = 0;
        } else if (value > maxValue) {
            value = maxValue;
        }
        if (value != entry.second && clampedCount != nullptr) {
            (*clampedCount)++;
        }
        out[entry.first] = value;
    }
    return out;
}

bool MirrorLoop::start() {
    if (_state != LoopState::IDLE) {
        LOG_WARN(TAG, "start() in state %s ignored", loopStateName(_state));
        return false;
    }

    bool ok = true;
    for (MotorChannel* follower : _followers) {
        if (!follower->enableTorque()) {
            ok = false;
        }
    }
    if (!ok) {
        LOG_WARN(TAG, "Some follower motors did not accept torque enable");
    }

    _state = LoopState::RUNNING;
    LOG_INFO(TAG, "Mirroring %d leader(s) -> %d follower(s): %s",
             (int)_leaders.size(), (int)_followers.size(), _table.describe().c_str());
    return true;
}

MotorChannel* MirrorLoop::findChannel(const std::vector<MotorChannel*>& channels, const std::string& label) const {
    for (MotorChannel* channel : channels) {
        if (channel->label() == label) {
            return channel;
        }
    }
    return nullptr;
}

void MirrorLoop::runCycle() {
    if (_state != LoopState::RUNNING) {
        return;
    }

    // Remaps land between cycles only
    _remaps.drainInto(_table);
    std::vector<MappingPair> pairs = _table.snapshot();

    // Parallel leader reads, one worker per bus
    std::vector<std::future<PositionMap>> reads;
    for (MotorChannel* leader : _leaders) {
        reads.push_back(leader->readPositionsAsync());
    }

    std::map<std::string, PositionMap> positions;
    uint32_t readFailures = 0;
    for (size_t i = 0; i < _leaders.size(); i++) {
        PositionMap got = reads[i].get();
        readFailures += (uint32_t)(_leaders[i]->motorIds().size() - got.size());
        positions[_leaders[i]->label()] = got;
    }

    // Clamp and write to mapped followers
    uint32_t clamped = 0;
    std::vector<std::future<size_t>> writes;
    std::vector<size_t> expected;
    for (const MappingPair& pair : pairs) {
        MotorChannel* follower = findChannel(_followers, pair.follower);
        auto it = positions.find(pair.leader);
        if (follower == nullptr || it == positions.end() || it->second.empty()) {
            continue;
        }
        PositionMap target = clampPositions(it->second, follower->resolution(), &clamped);
        expected.push_back(target.size());
        writes.push_back(follower->writePositionsAsync(target));
    }

    uint32_t writeFailures = 0;
    for (size_t i = 0; i < writes.size(); i++) {
        size_t written = writes[i].get();
        writeFailures += (uint32_t)(expected[i] - written);
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _stats.cycles++;
    _stats.readFailures += readFailures;
    _stats.writeFailures += writeFailures;
    _stats.clamped += clamped;
    _lastPositions = positions;
}

void MirrorLoop::run(int fps, const std::atomic<bool>& stopFlag, double durationSec) {
    if (!start()) {
        return;
    }

    LoopTimer timer(fps);
    auto begin = std::chrono::steady_clock::now();
    unsigned long lastLogMs = logMillis();

    while (!stopFlag) {
        if (durationSec > 0.0) {
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
            if (elapsed >= durationSec) {
                LOG_INFO(TAG, "Duration %.1fs reached", durationSec);
                break;
            }
        }

        runCycle();
        renderDisplay();

        // Periodic counters (every 5s) when the display isn't showing them
        unsigned long now = logMillis();
        if ((now - lastLogMs) >= 5000) {
            lastLogMs = now;
            MirrorStats s = stats();
            LOG_DEBUG(TAG, "cycles=%u readFail=%u writeFail=%u clamped=%u overruns=%u last=%.1fms",
                      s.cycles, s.readFailures, s.writeFailures, s.clamped, s.overruns, s.lastCycleMs);
        }

        timer.waitNext();
        std::lock_guard<std::mutex> lock(_mutex);
        _stats.lastCycleMs = timer.lastWorkMs();
        _stats.overruns = timer.overruns();
    }

    stop();
}

void MirrorLoop::stop() {
    if (_state == LoopState::STOPPED) {
        return;
    }
    _state = LoopState::STOPPED;

    for (MotorChannel* channel : _leaders) {
        channel->close();
    }
    for (MotorChannel* channel : _followers) {
        channel->close();
    }

    MirrorStats s = stats();
    LOG_INFO(TAG, "Stopped after %u cycles (read failures %u, write failures %u, clamped %u, overruns %u)",
             s.cycles, s.readFailures, s.writeFailures, s.clamped, s.overruns);
}

MirrorStats MirrorLoop::stats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stats;
}

std::map<std::string, PositionMap> MirrorLoop::lastPositions() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastPositions;
}

void MirrorLoop::renderDisplay() {
    if (_display == nullptr || !_display->due()) {
        return;
    }

    DisplayFrame frame;
    frame.title = "ArmMirror - local mirror";
    std::map<std::string, PositionMap> positions = lastPositions();
    for (MotorChannel* leader : _leaders) {
        ArmRow row;
        row.label = leader->label();
        row.positions = positions[leader->label()];
        row.resolution = leader->resolution();
        frame.arms.push_back(row);
    }
    frame.mapping = _table.describe();

    MirrorStats s = stats();
    char line[128];
    snprintf(line, sizeof(line), "cycle %.1f ms  cycles %u  overruns %u", s.lastCycleMs, s.cycles, s.overruns);
    frame.stats.push_back(line);
    snprintf(line, sizeof(line), "read failures %u  write failures %u  clamped %u",
             s.readFailures, s.writeFailures, s.clamped);
    frame.stats.push_back(line);
    frame.hint = "[s] swap pairs   [q] quit   Ctrl-C stop";

    _display->render(frame);
}

void MirrorLoop::fillStatus(JsonObject out) const {
    MirrorStats s = stats();
    out["mode"] = "mirror";
    out["state"] = loopStateName(_state);
    out["cycles"] = s.cycles;
    out["readFailures"] = s.readFailures;
    out["writeFailures"] = s.writeFailures;
    out["clamped"] = s.clamped;
    out["overruns"] = s.overruns;
    out["cycleMs"] = s.lastCycleMs;

    JsonArray mapping = out["mapping"].to<JsonArray>();
    for (const MappingPair& pair : _table.snapshot()) {
        JsonObject p = mapping.add<JsonObject>();
        p["leader"] = pair.leader;
        p["follower"] = pair.follower;
    }

    JsonObject arms = out["positions"].to<JsonObject>();
    for (const auto& arm : lastPositions()) {
        JsonObject joints = arms[arm.first].to<JsonObject>();
        for (const auto& joint : arm.second) {
            joints[std::to_string(joint.first)] = joint.second;
        }
    }
}
