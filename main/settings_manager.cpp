// =============================================================================
// Settings Manager - Implementation
// =============================================================================
// Command line via Boost.Program_options, settings file via ArduinoJson.
// =============================================================================

#include "settings_manager.h"
#include "config.h"
#include "debug_log.h"

#include <ArduinoJson.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <set>
#include <sstream>

namespace po = boost::program_options;

static const char* TAG = "Settings";

// ---- Run modes ----

struct ModeName {
    RunMode mode;
    const char* name;
};

static const ModeName MODE_NAMES[] = {
    { RunMode::IDENTIFY,  "identify"  },
    { RunMode::CALIBRATE, "calibrate" },
    { RunMode::MIRROR,    "mirror"    },
    { RunMode::LEADER,    "leader"    },
    { RunMode::FOLLOWER,  "follower"  },
    { RunMode::RELAY,     "relay"     },
    { RunMode::MONITOR,   "monitor"   },
};

const char* runModeName(RunMode mode) {
    for (const ModeName& m : MODE_NAMES) {
        if (m.mode == mode) {
            return m.name;
        }
    }
    return "?";
}

bool parseRunMode(const std::string& name, RunMode& out) {
    for (const ModeName& m : MODE_NAMES) {
        if (name == m.name) {
            out = m.mode;
            return true;
        }
    }
    return false;
}

// ---- Settings defaults ----

Settings::Settings()
    : baudRate(SERVO_BAUD_RATE),
      resolution(SERVO_RESOLUTION),
      calibrationDir(CALIB_DIR_DEFAULT),
      leaderPhase(DEFAULT_LEADER_PHASE),
      followerPhase(DEFAULT_FOLLOWER_PHASE),
      fps(MIRROR_TARGET_FPS),
      relayHost(RELAY_DEFAULT_HOST),
      relayPort(RELAY_DEFAULT_PORT),
      smoothing(RELAY_SMOOTHING),
      maxLatencyMs(RELAY_MAX_LATENCY_MS),
      maxStep(RELAY_MAX_STEP),
      statusIntervalMs(RELAY_STATUS_INTERVAL_MS),
      httpPort(STATUS_HTTP_PORT_DEFAULT) {
    SettingsManager::parseMotorIds(SERVO_DEFAULT_IDS, motorIds, nullptr);
}

int Settings::leadersFor() const {
    if (expectedLeaders >= 0) {
        return expectedLeaders;
    }
    switch (mode) {
        case RunMode::MIRROR: return DEFAULT_EXPECTED_LEADERS;
        case RunMode::LEADER: return DEFAULT_EXPECTED_LEADERS;
        case RunMode::FOLLOWER: return 0;
        default: return -1;     // Not checked
    }
}

int Settings::followersFor() const {
    if (expectedFollowers >= 0) {
        return expectedFollowers;
    }
    switch (mode) {
        case RunMode::MIRROR: return DEFAULT_EXPECTED_FOLLOWERS;
        case RunMode::LEADER: return 0;
        case RunMode::FOLLOWER: return DEFAULT_EXPECTED_FOLLOWERS;
        default: return -1;
    }
}

int Settings::probeMotorId() const {
    if (probeId >= 0) {
        return probeId;
    }
    return motorIds.empty() ? 1 : motorIds.front();
}

// ---------------------------------------------------------------------------
// Motor id lists
// ---------------------------------------------------------------------------

bool SettingsManager::parseMotorIds(const std::string& text, std::vector<uint8_t>& out, std::string* error) {
    std::vector<std::string> parts;
    boost::split(parts, text, boost::is_any_of(","));

    std::vector<uint8_t> ids;
    std::set<int> seen;
    for (std::string part : parts) {
        boost::trim(part);
        if (part.empty()) {
            continue;
        }
        int id = 0;
        try {
            id = boost::lexical_cast<int>(part);
        } catch (const boost::bad_lexical_cast&) {
            if (error) { *error = "motor id '" + part + "' is not a number"; }
            return false;
        }
        if (id < 0 || id > SERVO_MAX_ID) {
            if (error) { *error = "motor id " + part + " out of range 0.." + std::to_string(SERVO_MAX_ID); }
            return false;
        }
        if (!seen.insert(id).second) {
            if (error) { *error = "motor id " + part + " listed twice"; }
            return false;
        }
        ids.push_back((uint8_t)id);
    }

    if (ids.empty()) {
        if (error) { *error = "motor id list is empty"; }
        return false;
    }
    out = ids;
    return true;
}

// ---------------------------------------------------------------------------
// Clamping
// ---------------------------------------------------------------------------

static bool clampInt(const char* name, int& value, int lo, int hi) {
    int orig = value;
    if (value < lo) { value = lo; }
    if (value > hi) { value = hi; }
    if (value != orig) {
        LOG_WARN(TAG, "%s %d out of range [%d, %d], using %d", name, orig, lo, hi, value);
        return true;
    }
    return false;
}

static bool clampDouble(const char* name, double& value, double lo, double hi) {
    double orig = value;
    if (value < lo) { value = lo; }
    if (value > hi) { value = hi; }
    if (value != orig) {
        LOG_WARN(TAG, "%s %.3f out of range [%.3f, %.3f], using %.3f", name, orig, lo, hi, value);
        return true;
    }
    return false;
}

int SettingsManager::clampAll() {
    Settings& s = _settings;
    int changed = 0;
    changed += clampInt("baudrate", s.baudRate, 9600, 1000000);
    changed += clampInt("resolution", s.resolution, 256, 65536);
    changed += clampInt("fps", s.fps, MIRROR_MIN_FPS, MIRROR_MAX_FPS);
    changed += clampDouble("smoothing", s.smoothing, 0.0, 0.99);
    changed += clampDouble("max-latency-ms", s.maxLatencyMs, 1.0, 10000.0);
    changed += clampInt("max-step", s.maxStep, 1, s.resolution);
    changed += clampDouble("duration", s.durationSec, 0.0, 1.0e7);
    changed += clampInt("relay-port", s.relayPort, 1, 65535);
    changed += clampInt("status-interval-ms", s.statusIntervalMs, 100, 60000);
    changed += clampInt("http-port", s.httpPort, 0, 65535);
    changed += clampInt("leader-phase", s.leaderPhase, 0, 255);
    changed += clampInt("follower-phase", s.followerPhase, 0, 255);
    if (s.probeId >= 0) {
        changed += clampInt("probe-id", s.probeId, 0, SERVO_MAX_ID);
    }
    if (s.expectedLeaders >= 0) {
        changed += clampInt("leaders", s.expectedLeaders, 0, 16);
    }
    if (s.expectedFollowers >= 0) {
        changed += clampInt("followers", s.expectedFollowers, 0, 16);
    }
    return changed;
}

// ---------------------------------------------------------------------------
// JSON settings file
// ---------------------------------------------------------------------------

template <typename T>
static bool readField(JsonObjectConst obj, const char* key, T& out, std::string& error) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) {
        return true;
    }
    if (!v.is<T>()) {
        error = std::string("settings key '") + key + "' has the wrong type";
        return false;
    }
    out = v.as<T>();
    return true;
}

static bool readString(JsonObjectConst obj, const char* key, std::string& out, std::string& error) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) {
        return true;
    }
    if (!v.is<const char*>()) {
        error = std::string("settings key '") + key + "' must be a string";
        return false;
    }
    out = v.as<std::string>();
    return true;
}

bool SettingsManager::loadJson(const std::string& json) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        return fail(std::string("settings JSON: ") + err.c_str());
    }
    if (!doc.is<JsonObject>()) {
        return fail("settings JSON must be an object");
    }
    JsonObjectConst obj = doc.as<JsonObjectConst>();

    Settings s = _settings;
    std::string error;
    bool ok = readField(obj, "baudrate", s.baudRate, error)
        && readField(obj, "resolution", s.resolution, error)
        && readField(obj, "probe_id", s.probeId, error)
        && readField(obj, "leaders", s.expectedLeaders, error)
        && readField(obj, "followers", s.expectedFollowers, error)
        && readString(obj, "calibration_dir", s.calibrationDir, error)
        && readField(obj, "calibration_check", s.calibrationCheck, error)
        && readField(obj, "leader_phase", s.leaderPhase, error)
        && readField(obj, "follower_phase", s.followerPhase, error)
        && readField(obj, "fps", s.fps, error)
        && readField(obj, "duration", s.durationSec, error)
        && readField(obj, "display", s.display, error)
        && readField(obj, "shuffle_mapping", s.shuffleMapping, error)
        && readString(obj, "relay_host", s.relayHost, error)
        && readField(obj, "relay_port", s.relayPort, error)
        && readString(obj, "node_id", s.nodeId, error)
        && readField(obj, "smoothing", s.smoothing, error)
        && readField(obj, "max_latency_ms", s.maxLatencyMs, error)
        && readField(obj, "max_step", s.maxStep, error)
        && readField(obj, "status_interval_ms", s.statusIntervalMs, error)
        && readField(obj, "http_port", s.httpPort, error)
        && readString(obj, "log_level", s.logLevel, error);
    if (!ok) {
        return fail(error);
    }

    // motor_ids: [1,2,3] or "1,2,3"
    JsonVariantConst ids = obj["motor_ids"];
    if (ids.is<const char*>()) {
        if (!parseMotorIds(ids.as<std::string>(), s.motorIds, &error)) {
            return fail(error);
        }
    } else if (ids.is<JsonArrayConst>()) {
        std::string joined;
        for (JsonVariantConst id : ids.as<JsonArrayConst>()) {
            if (!id.is<int>()) {
                return fail("settings key 'motor_ids' must hold integers");
            }
            joined += std::to_string(id.as<int>()) + ",";
        }
        if (!parseMotorIds(joined, s.motorIds, &error)) {
            return fail(error);
        }
    } else if (!ids.isNull()) {
        return fail("settings key 'motor_ids' must be an array or a string");
    }

    JsonVariantConst ports = obj["ports"];
    if (ports.is<JsonArrayConst>()) {
        s.ports.clear();
        for (JsonVariantConst port : ports.as<JsonArrayConst>()) {
            if (!port.is<const char*>()) {
                return fail("settings key 'ports' must hold strings");
            }
            s.ports.push_back(port.as<std::string>());
        }
    } else if (!ports.isNull()) {
        return fail("settings key 'ports' must be an array");
    }

    _settings = s;
    return true;
}

bool SettingsManager::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return fail("can't read settings file " + path);
    }
    std::stringstream text;
    text << file.rdbuf();
    if (!loadJson(text.str())) {
        _error = path + ": " + _error;
        return false;
    }
    LOG_INFO(TAG, "Loaded settings from %s", path.c_str());
    return true;
}

std::string SettingsManager::toJson() const {
    const Settings& s = _settings;
    JsonDocument doc;

    JsonArray ports = doc["ports"].to<JsonArray>();
    for (const std::string& port : s.ports) {
        ports.add(port);
    }
    JsonArray ids = doc["motor_ids"].to<JsonArray>();
    for (uint8_t id : s.motorIds) {
        ids.add(id);
    }
    doc["baudrate"] = s.baudRate;
    doc["resolution"] = s.resolution;
    doc["probe_id"] = s.probeId;
    doc["leaders"] = s.expectedLeaders;
    doc["followers"] = s.expectedFollowers;
    doc["calibration_dir"] = s.calibrationDir;
    doc["calibration_check"] = s.calibrationCheck;
    doc["leader_phase"] = s.leaderPhase;
    doc["follower_phase"] = s.followerPhase;
    doc["fps"] = s.fps;
    doc["duration"] = s.durationSec;
    doc["display"] = s.display;
    doc["shuffle_mapping"] = s.shuffleMapping;
    doc["relay_host"] = s.relayHost;
    doc["relay_port"] = s.relayPort;
    doc["node_id"] = s.nodeId;
    doc["smoothing"] = s.smoothing;
    doc["max_latency_ms"] = s.maxLatencyMs;
    doc["max_step"] = s.maxStep;
    doc["status_interval_ms"] = s.statusIntervalMs;
    doc["http_port"] = s.httpPort;
    doc["log_level"] = s.logLevel;

    std::string output;
    serializeJsonPretty(doc, output);
    return output;
}

bool SettingsManager::saveFile(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        LOG_ERROR(TAG, "Can't write %s", path.c_str());
        return false;
    }
    file << toJson() << "\n";
    if (!file.good()) {
        LOG_ERROR(TAG, "Write error on %s", path.c_str());
        return false;
    }
    LOG_INFO(TAG, "Settings saved to %s", path.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

static po::options_description visibleOptions() {
    po::options_description general("General");
    general.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(), "JSON settings file (command line overrides it)")
        ("save-config", po::value<std::string>(), "write the effective settings to this file")
        ("log-level", po::value<std::string>(), "error | warn | info | debug | none")
        ("http-port", po::value<int>(), "serve /status, /logs and /health on this port (0 = off)")
        ("duration", po::value<double>(), "stop after this many seconds (0 = run until stopped)")
        ("no-display", po::bool_switch(), "plain log output instead of the live display");

    po::options_description bus("Servo bus");
    bus.add_options()
        ("port,p", po::value<std::vector<std::string>>()->composing(), "serial port (repeatable; default: auto-detect)")
        ("motor-ids", po::value<std::string>(), "comma-separated motor ids (default " SERVO_DEFAULT_IDS ")")
        ("baudrate", po::value<int>(), "bus baud rate")
        ("resolution", po::value<int>(), "encoder ticks per revolution")
        ("probe-id", po::value<int>(), "motor id read for the supply voltage (default: first id)")
        ("leaders", po::value<int>(), "expected leader arm count")
        ("followers", po::value<int>(), "expected follower arm count");

    po::options_description calib("Calibration");
    calib.add_options()
        ("calibration-dir", po::value<std::string>(), "where calibration records live")
        ("no-calibration-check", po::bool_switch(), "start motion without checking calibration records")
        ("continuous", po::bool_switch(), "calibrate: keep going, one robot after another")
        ("leader-phase", po::value<int>(), "Phase register value for leader servos")
        ("follower-phase", po::value<int>(), "Phase register value for follower servos");

    po::options_description loop("Mirroring");
    loop.add_options()
        ("fps", po::value<int>(), "control loop rate")
        ("shuffle-mapping", po::bool_switch(), "start from a random leader -> follower mapping");

    po::options_description relay("Relay");
    relay.add_options()
        ("relay-host", po::value<std::string>(), "relay hub address")
        ("relay-port", po::value<int>(), "relay hub UDP port")
        ("node-id", po::value<std::string>(), "name reported in status messages")
        ("smoothing", po::value<double>(), "follower smoothing factor 0..0.99")
        ("max-latency-ms", po::value<double>(), "follower drops telemetry older than this")
        ("max-step", po::value<int>(), "follower max ticks per applied message")
        ("status-interval-ms", po::value<int>(), "status publish interval");

    po::options_description all;
    all.add(general).add(bus).add(calib).add(loop).add(relay);
    return all;
}

std::string SettingsManager::usage() const {
    std::ostringstream out;
    out << "Usage: armmirror <mode> [options]\n\n"
        << "Modes:\n"
        << "  identify    list ports, supply voltages and roles\n"
        << "  calibrate   record homing offsets (--continuous for several robots)\n"
        << "  mirror      mirror local leader arms onto local follower arms\n"
        << "  leader      publish leader arm positions to the relay\n"
        << "  follower    apply relayed positions to follower arms\n"
        << "  relay       run the relay hub\n"
        << "  monitor     live position display, torque stays off\n"
        << visibleOptions();
    return out.str();
}

bool SettingsManager::fail(const std::string& message) {
    _error = message;
    return false;
}

SettingsManager::ParseResult SettingsManager::parse(int argc, const char* const argv[]) {
    po::options_description all = visibleOptions();
    all.add_options()("mode", po::value<std::string>(), "run mode");
    po::positional_options_description positional;
    positional.add("mode", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fail(e.what());
        return ParseResult::ERROR;
    }

    if (vm.count("help")) {
        return ParseResult::HELP;
    }
    if (!vm.count("mode")) {
        fail("no mode given");
        return ParseResult::ERROR;
    }

    // File first, command line on top
    if (vm.count("config") && !loadFile(vm["config"].as<std::string>())) {
        return ParseResult::ERROR;
    }

    Settings& s = _settings;
    std::string mode = vm["mode"].as<std::string>();
    if (!parseRunMode(mode, s.mode)) {
        fail("unknown mode '" + mode + "'");
        return ParseResult::ERROR;
    }

    if (vm.count("port")) { s.ports = vm["port"].as<std::vector<std::string>>(); }
    if (vm.count("motor-ids")) {
        std::string error;
        if (!parseMotorIds(vm["motor-ids"].as<std::string>(), s.motorIds, &error)) {
            fail(error);
            return ParseResult::ERROR;
        }
    }
    if (vm.count("baudrate")) { s.baudRate = vm["baudrate"].as<int>(); }
    if (vm.count("resolution")) { s.resolution = vm["resolution"].as<int>(); }
    if (vm.count("probe-id")) { s.probeId = vm["probe-id"].as<int>(); }
    if (vm.count("leaders")) { s.expectedLeaders = vm["leaders"].as<int>(); }
    if (vm.count("followers")) { s.expectedFollowers = vm["followers"].as<int>(); }
    if (vm.count("calibration-dir")) { s.calibrationDir = vm["calibration-dir"].as<std::string>(); }
    if (vm["no-calibration-check"].as<bool>()) { s.calibrationCheck = false; }
    if (vm["continuous"].as<bool>()) { s.continuous = true; }
    if (vm.count("leader-phase")) { s.leaderPhase = vm["leader-phase"].as<int>(); }
    if (vm.count("follower-phase")) { s.followerPhase = vm["follower-phase"].as<int>(); }
    if (vm.count("fps")) { s.fps = vm["fps"].as<int>(); }
    if (vm.count("duration")) { s.durationSec = vm["duration"].as<double>(); }
    if (vm["no-display"].as<bool>()) { s.display = false; }
    if (vm["shuffle-mapping"].as<bool>()) { s.shuffleMapping = true; }
    if (vm.count("relay-host")) { s.relayHost = vm["relay-host"].as<std::string>(); }
    if (vm.count("relay-port")) { s.relayPort = vm["relay-port"].as<int>(); }
    if (vm.count("node-id")) { s.nodeId = vm["node-id"].as<std::string>(); }
    if (vm.count("smoothing")) { s.smoothing = vm["smoothing"].as<double>(); }
    if (vm.count("max-latency-ms")) { s.maxLatencyMs = vm["max-latency-ms"].as<double>(); }
    if (vm.count("max-step")) { s.maxStep = vm["max-step"].as<int>(); }
    if (vm.count("status-interval-ms")) { s.statusIntervalMs = vm["status-interval-ms"].as<int>(); }
    if (vm.count("http-port")) { s.httpPort = vm["http-port"].as<int>(); }
    if (vm.count("log-level")) { s.logLevel = vm["log-level"].as<std::string>(); }
    if (vm.count("save-config")) { s.saveConfigPath = vm["save-config"].as<std::string>(); }

    if (debugLogParseLevel(s.logLevel.c_str()) < 0) {
        fail("unknown log level '" + s.logLevel + "'");
        return ParseResult::ERROR;
    }

    clampAll();
    return ParseResult::OK;
}
