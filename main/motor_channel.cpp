// =============================================================================
// Motor Channel Module - Implementation
// =============================================================================

#include "motor_channel.h"
#include "config.h"
#include "debug_log.h"

static const char* TAG = "Channel";

const char* roleName(Role role) {
    switch (role) {
        case Role::LEADER:   return "Leader";
        case Role::FOLLOWER: return "Follower";
        case Role::UNKNOWN:  return "Unknown";
    }
    return "Unknown";
}

MotorChannel::MotorChannel(std::unique_ptr<MotorBus> bus, const std::vector<uint8_t>& motorIds, int resolution)
    : _bus(std::move(bus)),
      _motorIds(motorIds),
      _resolution(resolution),
      _workGuard(boost::asio::make_work_guard(_worker)),
      _running(false),
      _readErrors(0),
      _writeErrors(0) {
}

MotorChannel::~MotorChannel() {
    close();
}

bool MotorChannel::open() {
    if (_running) {
        return true;
    }
    if (!_bus->open()) {
        return false;
    }

    _running = true;
    _thread = std::thread([this]() { _worker.run(); });
    LOG_DEBUG(TAG, "%s: worker started (%d motors)", port().c_str(), (int)_motorIds.size());
    return true;
}

void MotorChannel::close() {
    if (_running) {
        // Let queued transactions finish, then let run() return
        _workGuard.reset();
        if (_thread.joinable()) {
            _thread.join();
        }
        _running = false;
    }
    if (_bus->isOpen()) {
        _bus->close();
    }
}

bool MotorChannel::isOpen() const {
    return _bus->isOpen();
}

const std::string& MotorChannel::port() const {
    return _bus->port();
}

void MotorChannel::assign(Role role, const std::string& label) {
    _role = role;
    _label = label;
}

// ---------------------------------------------------------------------------
// Position I/O
// ---------------------------------------------------------------------------

PositionMap MotorChannel::readPositions() {
    return readPositionsAsync().get();
}

std::future<PositionMap> MotorChannel::readPositionsAsync() {
    return submit([this](MotorBus& bus) { return doReadPositions(bus); });
}

size_t MotorChannel::writePositions(const PositionMap& positions) {
    return writePositionsAsync(positions).get();
}

std::future<size_t> MotorChannel::writePositionsAsync(const PositionMap& positions) {
    return submit([this, positions](MotorBus& bus) { return doWritePositions(bus, positions); });
}

PositionMap MotorChannel::doReadPositions(MotorBus& bus) {
    PositionMap positions;
    for (uint8_t id : _motorIds) {
        int raw = 0;
        BusResult result = bus.readRaw(id, raw);
        noteResult(id, "read", result);
        if (result == BusResult::OK) {
            positions[id] = raw;
        } else {
            _readErrors++;
        }
    }
    return positions;
}

size_t MotorChannel::doWritePositions(MotorBus& bus, const PositionMap& positions) {
    size_t written = 0;
    for (const auto& entry : positions) {
        BusResult result = bus.writeRaw(entry.first, entry.second);
        noteResult(entry.first, "write", result);
        if (result == BusResult::OK) {
            written++;
        } else {
            _writeErrors++;
        }
    }
    return written;
}

void MotorChannel::noteResult(uint8_t id, const char* what, BusResult result) {
    bool failing = (result != BusResult::OK);
    bool& wasFailing = _failing[id];
    if (failing && !wasFailing) {
        LOG_WARN(TAG, "%s id %d: %s failed (%s)", _label.empty() ? port().c_str() : _label.c_str(),
                 id, what, busResultName(result));
    } else if (!failing && wasFailing) {
        LOG_INFO(TAG, "%s id %d: responding again", _label.empty() ? port().c_str() : _label.c_str(), id);
    }
    wasFailing = failing;
}

// ---------------------------------------------------------------------------
// Device Setup
// ---------------------------------------------------------------------------

std::vector<uint8_t> MotorChannel::findUnresponsive() {
    return submit([this](MotorBus& bus) {
        std::vector<uint8_t> missing;
        for (uint8_t id : _motorIds) {
            if (!bus.ping(id)) {
                missing.push_back(id);
            }
        }
        return missing;
    }).get();
}

bool MotorChannel::enableTorque() {
    return submit([this](MotorBus& bus) {
        bool ok = true;
        for (uint8_t id : _motorIds) {
            BusResult torque = bus.writeRegister(id, FeetechReg::TORQUE_ENABLE, 1);
            BusResult lock = bus.writeRegister(id, FeetechReg::LOCK, 1);
            if (torque != BusResult::OK || lock != BusResult::OK) {
                LOG_WARN(TAG, "%s id %d: torque enable failed (%s/%s)", _label.c_str(), id,
                         busResultName(torque), busResultName(lock));
                ok = false;
            }
        }
        if (ok) {
            LOG_INFO(TAG, "%s: torque enabled on %d motors", _label.c_str(), (int)_motorIds.size());
        }
        return ok;
    }).get();
}

float MotorChannel::readVoltage(uint8_t probeId) {
    return submit([probeId](MotorBus& bus) { return bus.readVoltage(probeId); }).get();
}
