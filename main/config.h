#pragma once

// =============================================================================
// ArmMirror Configuration
// =============================================================================
// Compile-time defaults. Most values can be overridden at runtime from the
// command line or a JSON settings file (see settings_manager.h).
// =============================================================================

// -- Servo Bus Settings ------------------------------------------------------
#define SERVO_BAUD_RATE          1000000     // Feetech STS default (1 Mbps)
#define SERVO_RESOLUTION         4096        // Encoder ticks per revolution
#define SERVO_REPLY_TIMEOUT_MS   20          // Per-transaction status reply timeout
#define SERVO_DEFAULT_IDS        "1,2,3,4,5,6"
#define SERVO_MAX_ID             253         // 254 is broadcast

// -- Role Identification -----------------------------------------------------
// Leaders are powered from USB (5V), followers from the 12V supply.
#define LEADER_VOLTAGE_V         5.0f
#define LEADER_VOLTAGE_TOL_V     0.5f
#define FOLLOWER_VOLTAGE_V       12.0f
#define FOLLOWER_VOLTAGE_TOL_V   1.0f
#define DEFAULT_EXPECTED_LEADERS    2
#define DEFAULT_EXPECTED_FOLLOWERS  2

// -- Calibration -------------------------------------------------------------
// Phase register encodes direction/feedback polarity. Leaders and followers
// are mounted mirrored, so they get different values.
#define DEFAULT_LEADER_PHASE     12
#define DEFAULT_FOLLOWER_PHASE   76
#define CALIB_LOCK_VALUE         0           // Lock written during calibration
#define CALIB_OPERATING_MODE     0           // Position mode
#define CALIB_DIR_DEFAULT        "calibration"
#define HOMING_OFFSET_SIGN_BIT   11

// -- Mirror Loop -------------------------------------------------------------
#define MIRROR_TARGET_FPS        60
#define MIRROR_MIN_FPS           1
#define MIRROR_MAX_FPS           500

// -- Relay (network) Settings ------------------------------------------------
#define RELAY_DEFAULT_HOST       "127.0.0.1"
#define RELAY_DEFAULT_PORT       7400
#define RELAY_RESUBSCRIBE_MS     2000        // Fixed reconnect/keepalive interval
#define RELAY_SUBSCRIBER_TTL_MS  10000       // Hub drops silent subscribers after this
#define RELAY_MAX_DATAGRAM       4096

#define RELAY_CHANNEL_TELEMETRY  "robot-telemetry"
#define RELAY_CHANNEL_STATUS     "robot-status"
#define RELAY_CHANNEL_CONTROL    "robot-control"

#define RELAY_MAX_LATENCY_MS     200         // Follower drops older telemetry
#define RELAY_LATENCY_WARN_MS    100         // Leader warns when avg RTT/2 exceeds this
#define RELAY_LOSS_WARN          0.05f       // Leader warns above 5% unacked
#define RELAY_SMOOTHING          0.8f        // applied = a*prev + (1-a)*target
#define RELAY_MAX_STEP           200         // Max ticks moved per applied message
#define RELAY_STATUS_INTERVAL_MS 2000
#define RELAY_STATUS_TIMEOUT_MS  5000        // Peer considered gone after this
#define RELAY_PEER_SLOW_MS       1000        // Follower: leader "slow" after this
#define RELAY_DROP_WARN_RUN      10          // Consecutive latency drops before warning
#define RELAY_RTT_SAMPLES        100         // Leader RTT history window
#define RELAY_LATENCY_SAMPLES    100         // Follower latency history window
#define RELAY_PENDING_ACK_MAX    1000        // Unacked sends tracked by the leader

// -- Display Settings --------------------------------------------------------
#define DISPLAY_UPDATE_MS        200         // 5Hz terminal refresh
#define DISPLAY_LOG_LINES        6           // Recent log lines shown under the table
#define KEYBOARD_POLL_MS         100

// -- Status HTTP Server ------------------------------------------------------
#define STATUS_HTTP_PORT_DEFAULT 0           // 0 = disabled
#define STATUS_LOG_BATCH         30

// -- Debug Logging -----------------------------------------------------------
// Log levels: 0=NONE, 1=ERROR, 2=WARN, 3=INFO, 4=DEBUG
#define LOG_LEVEL                4           // Compile-time ceiling
#define LOG_LEVEL_DEFAULT        3           // Runtime threshold (INFO)
