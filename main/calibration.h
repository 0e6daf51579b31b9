#pragma once

// =============================================================================
// Calibration Module
// =============================================================================
// Homing-offset calibration for one arm and the JSON store that remembers it.
//
// The operator poses the arm in its "middle" pose; every joint's raw reading
// becomes offset = raw - resolution/2, written to the servo's Homing_Offset
// register (sign-magnitude, bit 11) so the pose reads as resolution/2 from
// then on. Leader and follower arms calibrated to the same pose then report
// the same numbers for the same posture.
//
// Usage:
//   CalibrationEngine engine(CalibrationSettings::defaults());
//   CalibrationResult r = engine.calibrate(bus, ids, Role::LEADER, 4096, confirmFn);
//   CalibrationStore store("calibration");
//   store.save(r.record);
// =============================================================================

#include "motor_channel.h"

#include <stdint.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct CalibrationRecord {
    std::string port;
    Role role = Role::UNKNOWN;
    std::vector<uint8_t> motorIds;
    std::map<uint8_t, int> homeOffsets;     // id -> signed offset, |offset| < resolution/2
    int resolution = 0;
    int64_t timestampMs = 0;
    std::string timestampStr;
    double voltage = 0.0;
};

struct CalibrationSettings {
    int leaderPhase;
    int followerPhase;
    int lockValue;          // Lock written while configuring
    int operatingMode;

    static CalibrationSettings defaults();
};

struct CalibrationResult {
    bool complete = false;              // Every requested id calibrated
    bool aborted = false;               // Operator declined the pose
    CalibrationRecord record;           // Offsets for the ids that succeeded
    std::vector<uint8_t> unresponsive;  // Failed ping, excluded
    std::vector<uint8_t> failed;        // Answered ping but a register access failed
};

// Returns true when the operator confirms the pose, false to abort.
typedef std::function<bool()> ConfirmFn;

class CalibrationEngine {
public:
    explicit CalibrationEngine(const CalibrationSettings& settings);

    CalibrationResult calibrate(MotorBus& bus, const std::vector<uint8_t>& motorIds,
                                Role role, int resolution, const ConfirmFn& confirm);

    // Compare device Homing_Offset registers against a stored record.
    // Returns the number of motors whose register disagrees (or can't be read).
    int verifyDevice(MotorBus& bus, const CalibrationRecord& record);

    // offset = raw - floor(resolution/2), magnitude clamped to fit the register
    static int computeOffset(int raw, int resolution);

private:
    CalibrationSettings _settings;

    bool prepareMotor(MotorBus& bus, uint8_t id, Role role, int resolution);
    bool writeOffset(MotorBus& bus, uint8_t id, int offset);
};

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::string calibrationToJson(const CalibrationRecord& record);
bool calibrationFromJson(const std::string& json, CalibrationRecord& out);

class CalibrationStore {
public:
    explicit CalibrationStore(const std::string& dir);

    // <dir>/<port basename>.json
    std::string pathFor(const std::string& port) const;

    bool save(const CalibrationRecord& record) const;
    bool load(const std::string& port, CalibrationRecord& out) const;

    // Does the record cover every id for this role and resolution?
    // On false, *reason says what is missing.
    static bool covers(const CalibrationRecord& record, const std::vector<uint8_t>& motorIds,
                       Role role, int resolution, std::string* reason);

private:
    std::string _dir;
};
