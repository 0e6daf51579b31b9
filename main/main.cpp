// =============================================================================
// ArmMirror - Main Application
// =============================================================================
// Parses settings, then runs one mode to completion:
//
//   identify / calibrate / monitor   setup and inspection tools
//   mirror                           local leader -> follower loop
//   leader / follower                the two ends of network mirroring
//   relay                            the hub both ends connect to
//
// SIGINT/SIGTERM request a clean stop; every mode closes its channels (and
// sends its relay disconnect) before exiting with the mapped exit code.
// =============================================================================

#include "config.h"
#include "debug_log.h"
#include "errors.h"
#include "settings_manager.h"
#include "session.h"
#include "calibration.h"
#include "mapping_table.h"
#include "mirror_loop.h"
#include "relay_leader.h"
#include "relay_follower.h"
#include "relay_hub.h"
#include "udp_relay_transport.h"
#include "display_manager.h"
#include "keyboard_listener.h"
#include "web_server.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

static const char* TAG = "Main";

// ---------------------------------------------------------------------------
// Stop request (signal handler and 'q' key)
// ---------------------------------------------------------------------------
static std::atomic<bool> s_stopRequested(false);

static void onStopSignal(int) {
    s_stopRequested = true;
}

static void installSignalHandlers() {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static SessionOptions sessionOptionsFrom(const Settings& s) {
    SessionOptions options;
    options.ports = s.ports;
    options.motorIds = s.motorIds;
    options.baudRate = s.baudRate;
    options.resolution = s.resolution;
    options.probeId = (uint8_t)s.probeMotorId();
    options.expectedLeaders = s.leadersFor();
    options.expectedFollowers = s.followersFor();
    options.calibrationDir = s.calibrationDir;
    return options;
}

static std::vector<std::string> labelsOf(const std::vector<MotorChannel*>& channels) {
    std::vector<std::string> labels;
    for (MotorChannel* channel : channels) {
        labels.push_back(channel->label());
    }
    return labels;
}

static bool useDisplay(const Settings& s) {
    return s.display && isatty(STDOUT_FILENO);
}

// Optional status server; failing to bind is not fatal.
static std::unique_ptr<WebServerManager> startWebServer(const Settings& s, WebServerManager::StatusProvider provider) {
    if (s.httpPort <= 0) {
        return nullptr;
    }
    auto server = std::make_unique<WebServerManager>(provider);
    if (!server->begin((uint16_t)s.httpPort)) {
        LOG_WARN(TAG, "Continuing without the status server");
        return nullptr;
    }
    return server;
}

// Single-key controls shared by the motion modes: s = swap pairs 0 and 1, q = quit
static void startKeys(KeyboardListener& keys, RemapQueue* remaps) {
    bool started = keys.begin([remaps](char c) {
        if (c == 'q' || c == 'Q') {
            s_stopRequested = true;
        } else if ((c == 's' || c == 'S') && remaps != nullptr) {
            remaps->post(0, 1);
        }
    });
    if (!started) {
        LOG_DEBUG(TAG, "stdin is not a terminal; keyboard controls off");
    }
}

// ---------------------------------------------------------------------------
// identify
// ---------------------------------------------------------------------------
static SessionError runIdentify(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.openChannels();
    if (err != SessionError::NONE) {
        return err;
    }
    err = session.assignRoles();

    printf("%-24s %-10s %s\n", "PORT", "ROLE", "LABEL");
    for (MotorChannel* channel : session.channels()) {
        printf("%-24s %-10s %s\n", channel->port().c_str(), roleName(channel->role()),
               channel->label().empty() ? "-" : channel->label().c_str());
    }
    printf("%d leader(s), %d follower(s), %d unknown\n", (int)session.roles().leaders.size(),
           (int)session.roles().followers.size(), (int)session.roles().unknown.size());
    return err;
}

// ---------------------------------------------------------------------------
// calibrate
// ---------------------------------------------------------------------------

// Blocks on stdin. ENTER confirms, "q" or EOF aborts.
static bool promptEnter(const std::string& message) {
    printf("%s\n> ", message.c_str());
    fflush(stdout);
    std::string line;
    if (!std::getline(std::cin, line)) {
        return false;
    }
    return !(line == "q" || line == "Q") && !s_stopRequested;
}

static SessionError calibrateRobot(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.openChannels();
    if (err == SessionError::NONE) {
        err = session.assignRoles();
    }
    if (err != SessionError::NONE) {
        return err;
    }

    CalibrationSettings calibSettings = CalibrationSettings::defaults();
    calibSettings.leaderPhase = s.leaderPhase;
    calibSettings.followerPhase = s.followerPhase;
    CalibrationEngine engine(calibSettings);
    CalibrationStore store(s.calibrationDir);

    bool allComplete = true;
    for (MotorChannel* channel : session.channels()) {
        std::string prompt = "Move " + channel->label() + " (" + channel->port() +
                             ") to the middle pose, then press ENTER (q + ENTER aborts)";
        ConfirmFn confirm = [prompt]() { return promptEnter(prompt); };

        CalibrationResult result = channel->submit([&](MotorBus& bus) {
            return engine.calibrate(bus, channel->motorIds(), channel->role(), channel->resolution(), confirm);
        }).get();

        if (result.aborted) {
            return SessionError::CALIBRATION_INCOMPLETE;
        }
        if (!result.record.homeOffsets.empty() && !store.save(result.record)) {
            allComplete = false;
            continue;
        }
        if (!result.complete) {
            allComplete = false;
        }
    }

    return allComplete ? SessionError::NONE : SessionError::CALIBRATION_INCOMPLETE;
}

static SessionError runCalibrate(const Settings& s) {
    SessionError worst = SessionError::NONE;
    int robots = 0;
    do {
        SessionError err = calibrateRobot(s);
        robots++;
        if (err != SessionError::NONE) {
            LOG_ERROR(TAG, "Robot %d: %s", robots, sessionErrorName(err));
            worst = err;
        } else {
            LOG_INFO(TAG, "Robot %d calibrated", robots);
        }
        if (!s.continuous || s_stopRequested) {
            break;
        }
    } while (promptEnter("Connect the next robot and press ENTER (q + ENTER to finish)"));

    if (s.continuous) {
        LOG_INFO(TAG, "Calibration session done: %d robot(s)", robots);
    }
    return worst;
}

// ---------------------------------------------------------------------------
// monitor
// ---------------------------------------------------------------------------
static SessionError runMonitor(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.openChannels();
    if (err != SessionError::NONE) {
        return err;
    }
    if (session.assignRoles() != SessionError::NONE) {
        LOG_WARN(TAG, "Role check failed; showing every port anyway");
    }
    for (MotorChannel* channel : session.channels()) {
        if (channel->label().empty()) {
            channel->assign(Role::UNKNOWN, channel->port());
        }
    }

    DisplayManager display;
    bool live = useDisplay(s);
    if (live) {
        display.begin();
    }
    KeyboardListener keys;
    startKeys(keys, nullptr);

    auto begin = std::chrono::steady_clock::now();
    unsigned long lastLogMs = 0;
    while (!s_stopRequested) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
        if (s.durationSec > 0.0 && elapsed >= s.durationSec) {
            break;
        }

        DisplayFrame frame;
        frame.title = "ArmMirror - position monitor (torque off)";
        for (MotorChannel* channel : session.channels()) {
            ArmRow row;
            row.label = channel->label();
            row.positions = channel->readPositions();
            row.resolution = channel->resolution();
            frame.arms.push_back(row);
        }
        frame.hint = "[q] quit   Ctrl-C stop";

        if (live) {
            if (display.due()) {
                display.render(frame);
            }
        } else if (logMillis() - lastLogMs >= 1000) {
            lastLogMs = logMillis();
            for (const ArmRow& row : frame.arms) {
                std::string line;
                for (const auto& joint : row.positions) {
                    char cell[32];
                    snprintf(cell, sizeof(cell), " %d:%d(%.0f%%)", joint.first, joint.second,
                             positionPercent(joint.second, row.resolution));
                    line += cell;
                }
                LOG_INFO(TAG, "%s%s", row.label.c_str(), line.c_str());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(DISPLAY_UPDATE_MS / 2));
    }

    keys.end();
    if (live) {
        display.end();
    }
    return SessionError::NONE;
}

// ---------------------------------------------------------------------------
// mirror
// ---------------------------------------------------------------------------
static SessionError runMirror(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.connect(s.calibrationCheck);
    if (err != SessionError::NONE) {
        return err;
    }

    MappingTable table;
    if (!table.begin(labelsOf(session.roles().leaders), labelsOf(session.roles().followers), s.shuffleMapping)) {
        return SessionError::ROLE_COUNT_MISMATCH;
    }
    RemapQueue remaps;
    MirrorLoop loop(session.roles().leaders, session.roles().followers, table, remaps);

    std::unique_ptr<WebServerManager> web = startWebServer(s, [&loop](JsonObject out) { loop.fillStatus(out); });

    DisplayManager display;
    if (useDisplay(s)) {
        display.begin();
        loop.setDisplay(&display);
    }
    KeyboardListener keys;
    startKeys(keys, &remaps);

    loop.run(s.fps, s_stopRequested, s.durationSec);

    keys.end();
    display.end();
    if (web) {
        web->end();
    }
    return SessionError::NONE;
}

// ---------------------------------------------------------------------------
// leader
// ---------------------------------------------------------------------------
static SessionError runLeader(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.connect(s.calibrationCheck);
    if (err != SessionError::NONE) {
        return err;
    }

    UdpRelayTransport transport(s.relayHost, (uint16_t)s.relayPort, RELAY_RESUBSCRIBE_MS);
    RelayLeaderConfig config;
    config.nodeId = s.nodeId.empty() ? "leader" : s.nodeId;
    config.fps = s.fps;
    config.statusIntervalMs = (unsigned int)s.statusIntervalMs;
    RelayLeader leader(session.roles().leaders, transport, config);

    if (!leader.begin()) {
        return SessionError::TRANSPORT;
    }

    std::unique_ptr<WebServerManager> web = startWebServer(s, [&leader](JsonObject out) { leader.fillStatus(out); });

    DisplayManager display;
    if (useDisplay(s)) {
        display.begin();
        leader.setDisplay(&display);
    }
    KeyboardListener keys;
    startKeys(keys, nullptr);

    leader.run(s_stopRequested, s.durationSec);

    keys.end();
    display.end();
    if (web) {
        web->end();
    }
    return SessionError::NONE;
}

// ---------------------------------------------------------------------------
// follower
// ---------------------------------------------------------------------------
static SessionError runFollower(const Settings& s) {
    Session session(sessionOptionsFrom(s));
    SessionError err = session.connect(s.calibrationCheck);
    if (err != SessionError::NONE) {
        return err;
    }

    // Remote leaders are labelled Leader1..N in their own port order
    std::vector<std::string> followerLabels = labelsOf(session.roles().followers);
    std::vector<std::string> leaderLabels;
    for (size_t i = 0; i < followerLabels.size(); i++) {
        leaderLabels.push_back("Leader" + std::to_string(i + 1));
    }

    MappingTable table;
    if (!table.begin(leaderLabels, followerLabels, s.shuffleMapping)) {
        return SessionError::ROLE_COUNT_MISMATCH;
    }
    RemapQueue remaps;

    UdpRelayTransport transport(s.relayHost, (uint16_t)s.relayPort, RELAY_RESUBSCRIBE_MS);
    RelayFollowerConfig config;
    config.nodeId = s.nodeId.empty() ? "follower" : s.nodeId;
    config.fps = s.fps;
    config.maxLatencyMs = s.maxLatencyMs;
    config.smoothing = s.smoothing;
    config.maxStep = s.maxStep;
    config.statusIntervalMs = (unsigned int)s.statusIntervalMs;
    RelayFollower follower(session.roles().followers, table, remaps, transport, config);

    if (!follower.begin()) {
        return SessionError::TRANSPORT;
    }

    std::unique_ptr<WebServerManager> web = startWebServer(s, [&follower](JsonObject out) { follower.fillStatus(out); });

    DisplayManager display;
    if (useDisplay(s)) {
        display.begin();
        follower.setDisplay(&display);
    }
    KeyboardListener keys;
    startKeys(keys, &remaps);

    follower.run(s_stopRequested, s.durationSec);

    keys.end();
    display.end();
    if (web) {
        web->end();
    }
    return SessionError::NONE;
}

// ---------------------------------------------------------------------------
// relay
// ---------------------------------------------------------------------------
static SessionError runRelay(const Settings& s) {
    boost::asio::io_context io;
    RelayHub hub(io, (uint16_t)s.relayPort);
    if (!hub.begin()) {
        return SessionError::TRANSPORT;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO(TAG, "Signal %d, stopping hub", signo);
            hub.end();
            io.stop();
        }
    });

    // Periodic stats on the hub's own thread
    boost::asio::steady_timer statsTimer(io);
    std::function<void()> armStats = [&]() {
        statsTimer.expires_after(std::chrono::milliseconds(s.statusIntervalMs * 5));
        statsTimer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            LOG_INFO(TAG, "Hub: %d telemetry / %d status subscriber(s), %llu forwarded",
                     (int)hub.subscriberCount(RELAY_CHANNEL_TELEMETRY),
                     (int)hub.subscriberCount(RELAY_CHANNEL_STATUS),
                     (unsigned long long)hub.forwarded());
            armStats();
        });
    };
    armStats();

    boost::asio::steady_timer durationTimer(io);
    if (s.durationSec > 0.0) {
        durationTimer.expires_after(std::chrono::milliseconds((int64_t)(s.durationSec * 1000.0)));
        durationTimer.async_wait([&](const boost::system::error_code& ec) {
            if (!ec) {
                LOG_INFO(TAG, "Duration %.1fs reached", s.durationSec);
                hub.end();
                io.stop();
            }
        });
    }

    std::unique_ptr<WebServerManager> web = startWebServer(s, [](JsonObject out) { out["mode"] = "relay"; });

    io.run();

    if (web) {
        web->end();
    }
    return SessionError::NONE;
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------
int main(int argc, char** argv) {
    debugLogInit(LOG_LEVEL_DEFAULT);

    SettingsManager settingsManager;
    SettingsManager::ParseResult parsed = settingsManager.parse(argc, argv);
    if (parsed == SettingsManager::ParseResult::HELP) {
        printf("%s", settingsManager.usage().c_str());
        return 0;
    }
    if (parsed == SettingsManager::ParseResult::ERROR) {
        fprintf(stderr, "armmirror: %s\n\n%s", settingsManager.error().c_str(), settingsManager.usage().c_str());
        return exitCodeFor(SessionError::USAGE);
    }

    const Settings& s = settingsManager.settings();
    debugLogSetLevel(debugLogParseLevel(s.logLevel.c_str()));

    if (!s.saveConfigPath.empty() && !settingsManager.saveFile(s.saveConfigPath)) {
        return exitCodeFor(SessionError::USAGE);
    }

    installSignalHandlers();
    LOG_INFO(TAG, "ArmMirror %s starting", runModeName(s.mode));

    SessionError err = SessionError::NONE;
    switch (s.mode) {
        case RunMode::IDENTIFY:  err = runIdentify(s);  break;
        case RunMode::CALIBRATE: err = runCalibrate(s); break;
        case RunMode::MONITOR:   err = runMonitor(s);   break;
        case RunMode::MIRROR:    err = runMirror(s);    break;
        case RunMode::LEADER:    err = runLeader(s);    break;
        case RunMode::FOLLOWER:  err = runFollower(s);  break;
        case RunMode::RELAY:     err = runRelay(s);     break;
    }

    if (err != SessionError::NONE) {
        LOG_ERROR(TAG, "%s failed: %s", runModeName(s.mode), sessionErrorName(err));
        return exitCodeFor(err);
    }
    LOG_INFO(TAG, "Clean stop");
    return 0;
}
