#pragma once

// =============================================================================
// Session Errors
// =============================================================================
// Fatal setup failures and the process exit code each one maps to.
// Recoverable errors (unresponsive servos, dropped telemetry) never show up
// here; they are counted and logged where they happen.
// =============================================================================

enum class SessionError {
    NONE,
    USAGE,                  // Bad command line or settings file
    ROLE_COUNT_MISMATCH,    // Wrong number of leaders/followers, or an unclassifiable channel
    CHANNEL_OPEN,           // No ports found, or a port failed to open
    CALIBRATION_INCOMPLETE, // Missing/partial record, or calibration failed
    TRANSPORT               // Relay transport or hub failed to start
};

inline const char* sessionErrorName(SessionError error) {
    switch (error) {
        case SessionError::NONE:                   return "none";
        case SessionError::USAGE:                  return "usage";
        case SessionError::ROLE_COUNT_MISMATCH:    return "RoleCountMismatch";
        case SessionError::CHANNEL_OPEN:           return "ChannelOpenFailed";
        case SessionError::CALIBRATION_INCOMPLETE: return "CalibrationIncomplete";
        case SessionError::TRANSPORT:              return "TransportFailed";
    }
    return "?";
}

inline int exitCodeFor(SessionError error) {
    switch (error) {
        case SessionError::NONE:                   return 0;
        case SessionError::USAGE:                  return 1;
        case SessionError::ROLE_COUNT_MISMATCH:    return 2;
        case SessionError::CHANNEL_OPEN:           return 3;
        case SessionError::CALIBRATION_INCOMPLETE: return 4;
        case SessionError::TRANSPORT:              return 5;
    }
    return 1;
}
