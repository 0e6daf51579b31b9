// =============================================================================
// Calibration Module - Implementation
// =============================================================================

#include "calibration.h"
#include "config.h"
#include "feetech_protocol.h"
#include "debug_log.h"

#include <ArduinoJson.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

static const char* TAG = "Calib";

CalibrationSettings CalibrationSettings::defaults() {
    CalibrationSettings s;
    s.leaderPhase = DEFAULT_LEADER_PHASE;
    s.followerPhase = DEFAULT_FOLLOWER_PHASE;
    s.lockValue = CALIB_LOCK_VALUE;
    s.operatingMode = CALIB_OPERATING_MODE;
    return s;
}

static std::string formatLocalTime(int64_t epochMs) {
    time_t secs = (time_t)(epochMs / 1000);
    struct tm local;
    localtime_r(&secs, &local);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

// =============================================================================
// Engine
// =============================================================================

CalibrationEngine::CalibrationEngine(const CalibrationSettings& settings)
    : _settings(settings) {
}

int CalibrationEngine::computeOffset(int raw, int resolution) {
    int offset = raw - resolution / 2;
    // Bounded by half a turn and by the sign-magnitude register width
    int limit = std::min(resolution / 2 - 1, (1 << HOMING_OFFSET_SIGN_BIT) - 1);
    if (offset > limit || offset < -limit) {
        int clamped = offset > 0 ? limit : -limit;
        LOG_WARN(TAG, "Offset %d out of range, clamped to %d", offset, clamped);
        offset = clamped;
    }
    return offset;
}

bool CalibrationEngine::prepareMotor(MotorBus& bus, uint8_t id, Role role, int resolution) {
    int phase = (role == Role::LEADER) ? _settings.leaderPhase : _settings.followerPhase;

    struct Step {
        const MotorRegister& reg;
        uint16_t value;
    };
    const Step steps[] = {
        { FeetechReg::LOCK,               0 },
        { FeetechReg::TORQUE_ENABLE,      0 },
        { FeetechReg::PHASE,              (uint16_t)phase },
        { FeetechReg::LOCK,               (uint16_t)_settings.lockValue },
        { FeetechReg::OPERATING_MODE,     (uint16_t)_settings.operatingMode },
        { FeetechReg::HOMING_OFFSET,      0 },
        { FeetechReg::MIN_POSITION_LIMIT, 0 },
        { FeetechReg::MAX_POSITION_LIMIT, (uint16_t)(resolution - 1) },
    };

    for (const Step& step : steps) {
        BusResult result = bus.writeRegister(id, step.reg, step.value);
        if (result != BusResult::OK) {
            LOG_ERROR(TAG, "id %d: write %s=%d failed (%s)", id, step.reg.name, step.value,
                      busResultName(result));
            return false;
        }
    }
    return true;
}

bool CalibrationEngine::writeOffset(MotorBus& bus, uint8_t id, int offset) {
    uint16_t encoded = encodeSignMagnitude(offset, HOMING_OFFSET_SIGN_BIT);
    BusResult result = bus.writeRegister(id, FeetechReg::HOMING_OFFSET, encoded);
    if (result != BusResult::OK) {
        LOG_ERROR(TAG, "id %d: write Homing_Offset failed (%s)", id, busResultName(result));
        return false;
    }
    // Commit to EEPROM
    result = bus.writeRegister(id, FeetechReg::LOCK, 1);
    if (result != BusResult::OK) {
        LOG_ERROR(TAG, "id %d: lock failed (%s)", id, busResultName(result));
        return false;
    }
    return true;
}

CalibrationResult CalibrationEngine::calibrate(MotorBus& bus, const std::vector<uint8_t>& motorIds,
                                               Role role, int resolution, const ConfirmFn& confirm) {
    CalibrationResult result;
    CalibrationRecord& record = result.record;
    record.port = bus.port();
    record.role = role;
    record.resolution = resolution;

    LOG_INFO(TAG, "%s: calibrating %d motor(s) as %s", bus.port().c_str(), (int)motorIds.size(), roleName(role));

    // 1. Presence check; unresponsive motors are excluded and reported
    std::vector<uint8_t> present;
    for (uint8_t id : motorIds) {
        if (bus.ping(id)) {
            present.push_back(id);
        } else {
            LOG_ERROR(TAG, "id %d: no response to ping", id);
            result.unresponsive.push_back(id);
        }
    }

    // 2-4. Torque off, role registers, position mode, clear offset, widen limits
    std::vector<uint8_t> prepared;
    for (uint8_t id : present) {
        if (prepareMotor(bus, id, role, resolution)) {
            prepared.push_back(id);
        } else {
            result.failed.push_back(id);
        }
    }

    if (prepared.empty()) {
        LOG_ERROR(TAG, "%s: no motors could be prepared", bus.port().c_str());
        return result;
    }

    // 5. Operator puts the arm in the middle pose
    if (confirm && !confirm()) {
        LOG_WARN(TAG, "%s: calibration aborted by operator", bus.port().c_str());
        result.aborted = true;
        return result;
    }

    float volts = bus.readVoltage(prepared.front());
    record.voltage = volts > 0.0f ? volts : 0.0;

    // 6-7. Read raw, compute offset, write it
    for (uint8_t id : prepared) {
        int raw = 0;
        BusResult read = bus.readRaw(id, raw);
        if (read != BusResult::OK) {
            LOG_ERROR(TAG, "id %d: position read failed (%s)", id, busResultName(read));
            result.failed.push_back(id);
            continue;
        }

        int offset = computeOffset(raw, resolution);
        if (!writeOffset(bus, id, offset)) {
            result.failed.push_back(id);
            continue;
        }

        int after = -1;
        if (bus.readRaw(id, after) == BusResult::OK) {
            LOG_INFO(TAG, "id %d: raw %d -> offset %d (now reads %d)", id, raw, offset, after);
        } else {
            LOG_INFO(TAG, "id %d: raw %d -> offset %d", id, raw, offset);
        }

        record.motorIds.push_back(id);
        record.homeOffsets[id] = offset;
    }

    int64_t nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    record.timestampMs = nowMs;
    record.timestampStr = formatLocalTime(nowMs);

    result.complete = result.unresponsive.empty() && result.failed.empty();
    if (result.complete) {
        LOG_INFO(TAG, "%s: calibration complete (%d motors)", bus.port().c_str(), (int)record.motorIds.size());
    } else {
        LOG_ERROR(TAG, "%s: calibration INCOMPLETE: %d unresponsive, %d failed",
                  bus.port().c_str(), (int)result.unresponsive.size(), (int)result.failed.size());
    }
    return result;
}

int CalibrationEngine::verifyDevice(MotorBus& bus, const CalibrationRecord& record) {
    int mismatches = 0;
    for (const auto& entry : record.homeOffsets) {
        uint16_t encoded = 0;
        BusResult result = bus.readRegister(entry.first, FeetechReg::HOMING_OFFSET, encoded);
        if (result != BusResult::OK) {
            LOG_WARN(TAG, "%s id %d: can't read Homing_Offset (%s)", record.port.c_str(),
                     entry.first, busResultName(result));
            mismatches++;
            continue;
        }
        int device = decodeSignMagnitude(encoded, HOMING_OFFSET_SIGN_BIT);
        if (device != entry.second) {
            LOG_WARN(TAG, "%s id %d: device offset %d differs from stored %d", record.port.c_str(),
                     entry.first, device, entry.second);
            mismatches++;
        }
    }
    return mismatches;
}

// =============================================================================
// JSON
// =============================================================================

static Role roleFromName(const char* name) {
    if (name == nullptr) {
        return Role::UNKNOWN;
    }
    std::string s(name);
    if (s == "leader") { return Role::LEADER; }
    if (s == "follower") { return Role::FOLLOWER; }
    return Role::UNKNOWN;
}

static const char* roleKey(Role role) {
    switch (role) {
        case Role::LEADER:   return "leader";
        case Role::FOLLOWER: return "follower";
        case Role::UNKNOWN:  return "unknown";
    }
    return "unknown";
}

std::string calibrationToJson(const CalibrationRecord& record) {
    JsonDocument doc;
    doc["port"] = record.port;
    doc["role"] = roleKey(record.role);
    doc["is_leader"] = (record.role == Role::LEADER);

    JsonArray ids = doc["motor_ids"].to<JsonArray>();
    for (uint8_t id : record.motorIds) {
        ids.add(id);
    }

    JsonObject home = doc["home_positions"].to<JsonObject>();
    for (const auto& entry : record.homeOffsets) {
        home[std::to_string(entry.first)] = entry.second;
    }

    doc["servo_resolution"] = record.resolution;
    doc["timestamp_ms"] = record.timestampMs;
    doc["timestamp_str"] = record.timestampStr;
    doc["voltage"] = record.voltage;

    std::string output;
    serializeJsonPretty(doc, output);
    return output;
}

bool calibrationFromJson(const std::string& json, CalibrationRecord& out) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        LOG_ERROR(TAG, "Invalid calibration JSON: %s", err.c_str());
        return false;
    }

    if (!doc["motor_ids"].is<JsonArray>() || !doc["home_positions"].is<JsonObject>() ||
        !doc["servo_resolution"].is<int>()) {
        LOG_ERROR(TAG, "Calibration JSON missing motor_ids/home_positions/servo_resolution");
        return false;
    }

    CalibrationRecord record;
    record.port = doc["port"] | "";
    record.role = roleFromName(doc["role"] | "unknown");
    record.resolution = doc["servo_resolution"].as<int>();
    record.timestampMs = doc["timestamp_ms"] | (int64_t)0;
    record.timestampStr = doc["timestamp_str"] | "";
    record.voltage = doc["voltage"] | 0.0;

    for (JsonVariant v : doc["motor_ids"].as<JsonArray>()) {
        int id = v.as<int>();
        if (id < 0 || id > SERVO_MAX_ID) {
            LOG_ERROR(TAG, "Calibration JSON: bad motor id %d", id);
            return false;
        }
        record.motorIds.push_back((uint8_t)id);
    }

    for (JsonPair kv : doc["home_positions"].as<JsonObject>()) {
        uint8_t id = 0;
        if (!feetechParseId(kv.key().c_str(), id)) {
            LOG_ERROR(TAG, "Calibration JSON: bad home_positions key '%s'", kv.key().c_str());
            return false;
        }
        int offset = kv.value().as<int>();
        if (offset >= record.resolution / 2 || offset <= -record.resolution / 2) {
            LOG_ERROR(TAG, "Calibration JSON: id %d offset %d out of range", id, offset);
            return false;
        }
        record.homeOffsets[id] = offset;
    }

    out = record;
    return true;
}

// =============================================================================
// Store
// =============================================================================

CalibrationStore::CalibrationStore(const std::string& dir)
    : _dir(dir) {
}

std::string CalibrationStore::pathFor(const std::string& port) const {
    std::string name = std::filesystem::path(port).filename().string();
    if (name.empty()) {
        name = "default";
    }
    return (std::filesystem::path(_dir) / (name + ".json")).string();
}

bool CalibrationStore::save(const CalibrationRecord& record) const {
    std::error_code ec;
    std::filesystem::create_directories(_dir, ec);
    if (ec) {
        LOG_ERROR(TAG, "Can't create %s: %s", _dir.c_str(), ec.message().c_str());
        return false;
    }

    std::string path = pathFor(record.port);
    std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            LOG_ERROR(TAG, "Can't write %s", tmp.c_str());
            return false;
        }
        file << calibrationToJson(record) << "\n";
        if (!file.good()) {
            LOG_ERROR(TAG, "Write error on %s", tmp.c_str());
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        LOG_ERROR(TAG, "Can't replace %s: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    LOG_INFO(TAG, "Saved calibration to %s", path.c_str());
    return true;
}

bool CalibrationStore::load(const std::string& port, CalibrationRecord& out) const {
    std::string path = pathFor(port);
    std::ifstream file(path);
    if (!file) {
        LOG_DEBUG(TAG, "No calibration file %s", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!calibrationFromJson(buffer.str(), out)) {
        LOG_ERROR(TAG, "Can't parse %s", path.c_str());
        return false;
    }
    return true;
}

bool CalibrationStore::covers(const CalibrationRecord& record, const std::vector<uint8_t>& motorIds,
                              Role role, int resolution, std::string* reason) {
    std::string why;
    if (record.role != role) {
        why = std::string("calibrated as ") + roleName(record.role) + ", identified as " + roleName(role);
    } else if (record.resolution != resolution) {
        why = "resolution " + std::to_string(record.resolution) + " != " + std::to_string(resolution);
    } else {
        for (uint8_t id : motorIds) {
            if (record.homeOffsets.find(id) == record.homeOffsets.end()) {
                if (!why.empty()) { why += ","; } else { why = "no offset for id "; }
                why += std::to_string(id);
            }
        }
    }
    if (reason != nullptr) {
        *reason = why;
    }
    return why.empty();
}
