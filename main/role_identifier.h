#pragma once

// =============================================================================
// Role Identifier Module
// =============================================================================
// Classifies each arm as Leader or Follower from the probe motor's supply
// voltage: leader arms run from USB (~5V), follower arms from the 12V brick.
// Runs once per session; a robot that is unplugged and replugged needs a
// fresh session.
//
// Usage:
//   RoleIdentifier ident;                       // default 5V/12V bands
//   RoleAssignment roles;
//   if (!ident.assignRoles(channels, 2, 2, roles)) { ... RoleCountMismatch ... }
// =============================================================================

#include "motor_channel.h"

#include <string>
#include <vector>

struct VoltageBand {
    float nominal;
    float tolerance;

    bool contains(float volts) const {
        return volts >= nominal - tolerance && volts <= nominal + tolerance;
    }
};

struct RoleAssignment {
    std::vector<MotorChannel*> leaders;      // "Leader1", "Leader2", ... in port order
    std::vector<MotorChannel*> followers;    // "Follower1", ...
    std::vector<MotorChannel*> unknown;
};

class RoleIdentifier {
public:
    RoleIdentifier();
    RoleIdentifier(const VoltageBand& leaderBand, const VoltageBand& followerBand);

    // Pure classification of a measured voltage
    Role classify(float volts) const;

    // Read the probe motor's voltage and classify. A failed read is UNKNOWN.
    Role identify(MotorChannel& channel, uint8_t probeId, float* measured = nullptr) const;

    // Identify every channel (in the given order), label them and check the
    // counts (a negative count is not checked). Returns false on any count
    // mismatch or unclassifiable channel.
    bool assignRoles(const std::vector<MotorChannel*>& channels, uint8_t probeId,
                     int expectedLeaders, int expectedFollowers,
                     RoleAssignment& out) const;

private:
    VoltageBand _leaderBand;
    VoltageBand _followerBand;
};
