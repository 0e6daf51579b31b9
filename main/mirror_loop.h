#pragma once

// =============================================================================
// Mirror Loop Module
// =============================================================================
// Local leader -> follower mirroring at a fixed rate. Each cycle:
//   1. applies pending remap requests (cycle boundary only)
//   2. snapshots the mapping table
//   3. reads every leader arm in parallel (one worker per bus)
//   4. clamps to [0, resolution-1] and writes to the mapped follower,
//      unsmoothed, waiting for all writes before the cycle ends
//   5. redraws the terminal display when due
//
// Stopping leaves every follower at its last commanded position and closes
// all channels.
//
// Usage:
//   MirrorLoop loop(roles.leaders, roles.followers, table, remaps);
//   loop.setDisplay(&display);
//   loop.run(60, stopFlag, 0.0);       // 0 = until stopped
// =============================================================================

#include "mapping_table.h"
#include "motor_channel.h"

#include <ArduinoJson.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class DisplayManager;

enum class LoopState {
    IDLE,
    RUNNING,
    STOPPED
};

const char* loopStateName(LoopState state);

struct MirrorStats {
    uint32_t cycles = 0;
    uint32_t readFailures = 0;      // Joint reads that returned nothing
    uint32_t writeFailures = 0;
    uint32_t clamped = 0;           // Values pulled back into [0, resolution-1]
    uint32_t overruns = 0;
    double lastCycleMs = 0.0;
};

class MirrorLoop {
public:
    MirrorLoop(const std::vector<MotorChannel*>& leaders,
               const std::vector<MotorChannel*>& followers,
               MappingTable& table, RemapQueue& remaps);

    void setDisplay(DisplayManager* display) { _display = display; }

    // IDLE -> RUNNING. Enables follower torque.
    bool start();

    // One read-transform-write cycle. Only valid while RUNNING.
    void runCycle();

    // start(), then cycles at `fps` until stopFlag is set or durationSec
    // elapses (0 = no limit), then stop().
    void run(int fps, const std::atomic<bool>& stopFlag, double durationSec);

    // -> STOPPED. Closes all channels.
    void stop();

    LoopState state() const { return _state; }
    MirrorStats stats() const;

    // Last values read per leader label
    std::map<std::string, PositionMap> lastPositions() const;

    // For the status endpoint
    void fillStatus(JsonObject out) const;

    static PositionMap clampPositions(const PositionMap& positions, int resolution, uint32_t* clampedCount);

private:
    std::vector<MotorChannel*> _leaders;
    std::vector<MotorChannel*> _followers;
    MappingTable& _table;
    RemapQueue& _remaps;
    DisplayManager* _display = nullptr;

    std::atomic<LoopState> _state{LoopState::IDLE};

    mutable std::mutex _mutex;
    MirrorStats _stats;
    std::map<std::string, PositionMap> _lastPositions;

    MotorChannel* findChannel(const std::vector<MotorChannel*>& channels, const std::string& label) const;
    void renderDisplay();
};
