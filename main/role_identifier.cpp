// =============================================================================
// Role Identifier Module - Implementation
// =============================================================================

#include "role_identifier.h"
#include "config.h"
#include "debug_log.h"

static const char* TAG = "Role";

RoleIdentifier::RoleIdentifier()
    : _leaderBand{LEADER_VOLTAGE_V, LEADER_VOLTAGE_TOL_V},
      _followerBand{FOLLOWER_VOLTAGE_V, FOLLOWER_VOLTAGE_TOL_V} {
}

RoleIdentifier::RoleIdentifier(const VoltageBand& leaderBand, const VoltageBand& followerBand)
    : _leaderBand(leaderBand),
      _followerBand(followerBand) {
}

Role RoleIdentifier::classify(float volts) const {
    if (volts < 0.0f) {
        return Role::UNKNOWN;
    }
    if (_leaderBand.contains(volts)) {
        return Role::LEADER;
    }
    if (_followerBand.contains(volts)) {
        return Role::FOLLOWER;
    }
    return Role::UNKNOWN;
}

Role RoleIdentifier::identify(MotorChannel& channel, uint8_t probeId, float* measured) const {
    float volts = channel.readVoltage(probeId);
    if (measured != nullptr) {
        *measured = volts;
    }
    if (volts < 0.0f) {
        LOG_WARN(TAG, "%s: no voltage reading from probe id %d", channel.port().c_str(), probeId);
        return Role::UNKNOWN;
    }

    Role role = classify(volts);
    LOG_INFO(TAG, "%s: %.1fV -> %s", channel.port().c_str(), volts, roleName(role));
    return role;
}

bool RoleIdentifier::assignRoles(const std::vector<MotorChannel*>& channels, uint8_t probeId,
                                 int expectedLeaders, int expectedFollowers,
                                 RoleAssignment& out) const {
    out = RoleAssignment();

    for (MotorChannel* channel : channels) {
        Role role = identify(*channel, probeId);
        switch (role) {
            case Role::LEADER:
                out.leaders.push_back(channel);
                channel->assign(role, "Leader" + std::to_string(out.leaders.size()));
                break;
            case Role::FOLLOWER:
                out.followers.push_back(channel);
                channel->assign(role, "Follower" + std::to_string(out.followers.size()));
                break;
            case Role::UNKNOWN:
                out.unknown.push_back(channel);
                channel->assign(role, "");
                break;
        }
    }

    for (MotorChannel* channel : out.leaders) {
        LOG_INFO(TAG, "%s = %s", channel->label().c_str(), channel->port().c_str());
    }
    for (MotorChannel* channel : out.followers) {
        LOG_INFO(TAG, "%s = %s", channel->label().c_str(), channel->port().c_str());
    }

    bool ok = true;
    if (!out.unknown.empty()) {
        for (MotorChannel* channel : out.unknown) {
            LOG_ERROR(TAG, "%s: voltage outside both bands (leader %.1f+-%.1fV, follower %.1f+-%.1fV)",
                      channel->port().c_str(), _leaderBand.nominal, _leaderBand.tolerance,
                      _followerBand.nominal, _followerBand.tolerance);
        }
        ok = false;
    }
    bool leadersWrong = expectedLeaders >= 0 && (int)out.leaders.size() != expectedLeaders;
    bool followersWrong = expectedFollowers >= 0 && (int)out.followers.size() != expectedFollowers;
    if (leadersWrong || followersWrong) {
        LOG_ERROR(TAG, "Role count mismatch: found %d leader(s) and %d follower(s), expected %d and %d",
                  (int)out.leaders.size(), (int)out.followers.size(), expectedLeaders, expectedFollowers);
        ok = false;
    }
    return ok;
}
