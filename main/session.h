#pragma once

// =============================================================================
// Session Module
// =============================================================================
// Everything that happens before motion: find the serial ports, open one
// MotorChannel per port, identify roles by supply voltage and check that
// each arm has a calibration record covering its motors.
//
// Usage:
//   Session session(options);
//   SessionError err = session.connect(true);
//   if (err != SessionError::NONE) { return exitCodeFor(err); }
//   MirrorLoop loop(session.roles().leaders, session.roles().followers, ...);
// =============================================================================

#include "calibration.h"
#include "errors.h"
#include "motor_channel.h"
#include "role_identifier.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct SessionOptions {
    std::vector<std::string> ports;         // Empty = auto-detect
    std::vector<uint8_t> motorIds;
    int baudRate = 0;
    int resolution = 0;
    uint8_t probeId = 1;
    int expectedLeaders = -1;               // -1 = not checked
    int expectedFollowers = -1;
    std::string calibrationDir;
};

// Creates the bus for one port. Tests substitute fakes.
typedef std::function<std::unique_ptr<MotorBus>(const std::string& port, int baudRate)> BusFactory;

class Session {
public:
    explicit Session(const SessionOptions& options, BusFactory factory = BusFactory());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Serial devices that look like servo adapters, sorted
    static std::vector<std::string> findRobotPorts(const std::string& devDir = "/dev");

    // Open a channel per port. Unresponsive ids are logged, not fatal.
    SessionError openChannels();

    // Identify and label every open channel, check counts.
    SessionError assignRoles();

    // Every leader/follower needs a stored record covering its ids.
    // Device offsets that disagree with the record are only warned about.
    SessionError checkCalibration();

    // openChannels + assignRoles (+ checkCalibration)
    SessionError connect(bool checkCalibrationRecords);

    // Close every channel. Idempotent.
    void close();

    const RoleAssignment& roles() const { return _roles; }
    std::vector<MotorChannel*> channels() const;
    const SessionOptions& options() const { return _options; }

private:
    SessionOptions _options;
    BusFactory _factory;
    std::vector<std::unique_ptr<MotorChannel>> _channels;
    RoleAssignment _roles;
};
