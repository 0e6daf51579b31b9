#pragma once

// =============================================================================
// Settings Manager Module
// =============================================================================
// Collects the runtime settings for one run. Sources, later wins:
//
//   1. compile-time defaults from config.h
//   2. JSON settings file (--config FILE)
//   3. command line
//
// Out-of-range numbers are clamped with a warning instead of refusing to run.
// Malformed input (unknown mode, bad motor id list, bad JSON) is an error.
// --save-config FILE writes the effective settings back as JSON.
//
// Usage:
//   SettingsManager settingsManager;
//   SettingsManager::ParseResult r = settingsManager.parse(argc, argv);
//   if (r == SettingsManager::ParseResult::HELP) { puts(settingsManager.usage().c_str()); }
//   const Settings& s = settingsManager.settings();
// =============================================================================

#include <stdint.h>
#include <string>
#include <vector>

enum class RunMode {
    IDENTIFY,       // List ports, voltages and roles
    CALIBRATE,      // Homing offsets, one robot (or one after another)
    MIRROR,         // Local leader -> follower loop
    LEADER,         // Relay: publish leader positions
    FOLLOWER,       // Relay: apply received positions
    RELAY,          // Relay hub
    MONITOR         // Live position display, no motion
};

const char* runModeName(RunMode mode);
bool parseRunMode(const std::string& name, RunMode& out);

struct Settings {
    RunMode mode = RunMode::MIRROR;

    // ---- Servo bus ----
    std::vector<std::string> ports;         // Empty = auto-detect
    std::vector<uint8_t> motorIds;
    int baudRate;
    int resolution;
    int probeId = -1;                       // -1 = first motor id

    // ---- Roles ----
    int expectedLeaders = -1;               // -1 = default for the mode
    int expectedFollowers = -1;

    // ---- Calibration ----
    std::string calibrationDir;
    bool calibrationCheck = true;
    bool continuous = false;
    int leaderPhase;
    int followerPhase;

    // ---- Loop ----
    int fps;
    double durationSec = 0.0;               // 0 = until stopped
    bool display = true;
    bool shuffleMapping = false;

    // ---- Relay ----
    std::string relayHost;
    int relayPort;
    std::string nodeId;                     // Empty = role name
    double smoothing;
    double maxLatencyMs;
    int maxStep;
    int statusIntervalMs;

    // ---- Ambient ----
    int httpPort;                           // 0 = no status server
    std::string logLevel = "info";
    std::string saveConfigPath;

    Settings();

    // Leader/follower counts after applying the mode defaults
    int leadersFor() const;
    int followersFor() const;
    int probeMotorId() const;
};

class SettingsManager {
public:
    enum class ParseResult {
        OK,
        HELP,
        ERROR
    };

    // Parse the command line (and the --config file it names).
    ParseResult parse(int argc, const char* const argv[]);

    const Settings& settings() const { return _settings; }
    Settings& settings() { return _settings; }

    // Why parse() returned ERROR
    const std::string& error() const { return _error; }

    std::string usage() const;

    // Merge a JSON document into the current settings. Unknown keys are
    // ignored; present keys must have the right type.
    bool loadJson(const std::string& json);
    bool loadFile(const std::string& path);

    std::string toJson() const;
    bool saveFile(const std::string& path) const;

    // Clamp every numeric setting into its valid range, warning per change.
    // Returns the number of values changed.
    int clampAll();

    // "1,2,3" -> {1,2,3}. Rejects empty lists, ids above SERVO_MAX_ID and
    // duplicates.
    static bool parseMotorIds(const std::string& text, std::vector<uint8_t>& out, std::string* error);

private:
    Settings _settings;
    std::string _error;

    bool fail(const std::string& message);
};
