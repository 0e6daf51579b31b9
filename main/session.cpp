// =============================================================================
// Session Module - Implementation
// =============================================================================

#include "session.h"
#include "config.h"
#include "debug_log.h"
#include "feetech_bus.h"

#include <algorithm>
#include <cstring>
#include <filesystem>

static const char* TAG = "Session";

// Device name prefixes of USB-serial adapters (Linux, then macOS)
static const char* PORT_PREFIXES[] = {
    "ttyUSB",
    "ttyACM",
    "cu.usbmodem",
    "cu.usbserial",
};

Session::Session(const SessionOptions& options, BusFactory factory)
    : _options(options),
      _factory(factory) {
    if (!_factory) {
        _factory = [](const std::string& port, int baudRate) -> std::unique_ptr<MotorBus> {
            return std::make_unique<FeetechBus>(port, (unsigned int)baudRate, SERVO_REPLY_TIMEOUT_MS);
        };
    }
}

Session::~Session() {
    close();
}

std::vector<std::string> Session::findRobotPorts(const std::string& devDir) {
    std::vector<std::string> ports;
    std::error_code ec;
    std::filesystem::directory_iterator it(devDir, ec);
    if (ec) {
        LOG_WARN(TAG, "Can't list %s: %s", devDir.c_str(), ec.message().c_str());
        return ports;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN(TAG, "Listing %s stopped early: %s", devDir.c_str(), ec.message().c_str());
            break;
        }
        std::string name = it->path().filename().string();
        for (const char* prefix : PORT_PREFIXES) {
            if (name.compare(0, strlen(prefix), prefix) == 0) {
                ports.push_back(it->path().string());
                break;
            }
        }
    }

    std::sort(ports.begin(), ports.end());
    return ports;
}

SessionError Session::openChannels() {
    std::vector<std::string> ports = _options.ports;
    if (ports.empty()) {
        ports = findRobotPorts();
        if (ports.empty()) {
            LOG_ERROR(TAG, "No servo adapters found (looked for /dev/ttyUSB*, /dev/ttyACM*)");
            return SessionError::CHANNEL_OPEN;
        }
        LOG_INFO(TAG, "Found %d port(s)", (int)ports.size());
    }

    for (const std::string& port : ports) {
        auto channel = std::make_unique<MotorChannel>(_factory(port, _options.baudRate), _options.motorIds,
                                                      _options.resolution);
        if (!channel->open()) {
            LOG_ERROR(TAG, "%s: failed to open", port.c_str());
            close();
            return SessionError::CHANNEL_OPEN;
        }

        std::vector<uint8_t> missing = channel->findUnresponsive();
        if (missing.size() == _options.motorIds.size()) {
            LOG_WARN(TAG, "%s: no motor answered", port.c_str());
        } else {
            for (uint8_t id : missing) {
                LOG_WARN(TAG, "%s: motor %d not responding", port.c_str(), id);
            }
        }
        _channels.push_back(std::move(channel));
    }
    return SessionError::NONE;
}

SessionError Session::assignRoles() {
    RoleIdentifier identifier;
    if (!identifier.assignRoles(channels(), _options.probeId, _options.expectedLeaders,
                                _options.expectedFollowers, _roles)) {
        return SessionError::ROLE_COUNT_MISMATCH;
    }
    return SessionError::NONE;
}

SessionError Session::checkCalibration() {
    CalibrationStore store(_options.calibrationDir);
    CalibrationEngine engine(CalibrationSettings::defaults());

    std::vector<MotorChannel*> arms = _roles.leaders;
    arms.insert(arms.end(), _roles.followers.begin(), _roles.followers.end());

    bool ok = true;
    for (MotorChannel* arm : arms) {
        CalibrationRecord record;
        if (!store.load(arm->port(), record)) {
            LOG_ERROR(TAG, "%s (%s): no calibration at %s; run 'armmirror calibrate' first",
                      arm->label().c_str(), arm->port().c_str(), store.pathFor(arm->port()).c_str());
            ok = false;
            continue;
        }

        std::string reason;
        if (!CalibrationStore::covers(record, arm->motorIds(), arm->role(), arm->resolution(), &reason)) {
            LOG_ERROR(TAG, "%s (%s): calibration incomplete: %s", arm->label().c_str(),
                      arm->port().c_str(), reason.c_str());
            ok = false;
            continue;
        }

        int mismatches = arm->submit([&engine, &record](MotorBus& bus) {
            return engine.verifyDevice(bus, record);
        }).get();
        if (mismatches > 0) {
            LOG_WARN(TAG, "%s: %d motor(s) disagree with the stored offsets", arm->label().c_str(), mismatches);
        } else {
            LOG_INFO(TAG, "%s: calibration from %s", arm->label().c_str(), record.timestampStr.c_str());
        }
    }

    return ok ? SessionError::NONE : SessionError::CALIBRATION_INCOMPLETE;
}

SessionError Session::connect(bool checkCalibrationRecords) {
    SessionError err = openChannels();
    if (err == SessionError::NONE) {
        err = assignRoles();
    }
    if (err == SessionError::NONE && checkCalibrationRecords) {
        err = checkCalibration();
    }
    if (err != SessionError::NONE) {
        close();
    }
    return err;
}

void Session::close() {
    for (std::unique_ptr<MotorChannel>& channel : _channels) {
        channel->close();
    }
}

std::vector<MotorChannel*> Session::channels() const {
    std::vector<MotorChannel*> out;
    for (const std::unique_ptr<MotorChannel>& channel : _channels) {
        out.push_back(channel.get());
    }
    return out;
}
