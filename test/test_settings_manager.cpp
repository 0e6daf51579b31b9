// =============================================================================
// Command line and settings file
// =============================================================================

#include "settings_manager.h"
#include "config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>

static SettingsManager::ParseResult parseArgs(SettingsManager& manager, std::initializer_list<const char*> args) {
    std::vector<const char*> argv = { "armmirror" };
    argv.insert(argv.end(), args.begin(), args.end());
    return manager.parse((int)argv.size(), argv.data());
}

TEST(Settings, DefaultsComeFromConfig) {
    Settings s;
    EXPECT_EQ(s.baudRate, SERVO_BAUD_RATE);
    EXPECT_EQ(s.resolution, SERVO_RESOLUTION);
    EXPECT_EQ(s.motorIds, (std::vector<uint8_t>{ 1, 2, 3, 4, 5, 6 }));
    EXPECT_EQ(s.fps, MIRROR_TARGET_FPS);
    EXPECT_EQ(s.maxStep, RELAY_MAX_STEP);
    EXPECT_EQ(s.leaderPhase, DEFAULT_LEADER_PHASE);
    EXPECT_EQ(s.followerPhase, DEFAULT_FOLLOWER_PHASE);
    EXPECT_EQ(s.probeMotorId(), 1);
}

TEST(Settings, ExpectedCountsDependOnMode) {
    Settings s;
    s.mode = RunMode::MIRROR;
    EXPECT_EQ(s.leadersFor(), 2);
    EXPECT_EQ(s.followersFor(), 2);
    s.mode = RunMode::LEADER;
    EXPECT_EQ(s.followersFor(), 0);
    s.mode = RunMode::FOLLOWER;
    EXPECT_EQ(s.leadersFor(), 0);
    s.mode = RunMode::IDENTIFY;
    EXPECT_EQ(s.leadersFor(), -1);
    s.expectedLeaders = 1;
    EXPECT_EQ(s.leadersFor(), 1);
}

TEST(SettingsManager, ParsesModeAndOptions) {
    SettingsManager manager;
    ASSERT_EQ(parseArgs(manager, { "follower", "--port", "/dev/ttyUSB2", "-p", "/dev/ttyUSB3",
                                   "--motor-ids", "1, 2,3", "--fps", "100", "--max-latency-ms", "150",
                                   "--relay-host", "10.0.0.5", "--no-display" }),
              SettingsManager::ParseResult::OK);
    const Settings& s = manager.settings();
    EXPECT_EQ(s.mode, RunMode::FOLLOWER);
    EXPECT_EQ(s.ports, (std::vector<std::string>{ "/dev/ttyUSB2", "/dev/ttyUSB3" }));
    EXPECT_EQ(s.motorIds, (std::vector<uint8_t>{ 1, 2, 3 }));
    EXPECT_EQ(s.fps, 100);
    EXPECT_DOUBLE_EQ(s.maxLatencyMs, 150.0);
    EXPECT_EQ(s.relayHost, "10.0.0.5");
    EXPECT_FALSE(s.display);
    EXPECT_TRUE(s.calibrationCheck);
}

TEST(SettingsManager, HelpAndErrors) {
    SettingsManager help;
    EXPECT_EQ(parseArgs(help, { "--help" }), SettingsManager::ParseResult::HELP);
    EXPECT_NE(help.usage().find("calibrate"), std::string::npos);

    SettingsManager noMode;
    EXPECT_EQ(parseArgs(noMode, {}), SettingsManager::ParseResult::ERROR);

    SettingsManager badMode;
    EXPECT_EQ(parseArgs(badMode, { "dance" }), SettingsManager::ParseResult::ERROR);
    EXPECT_NE(badMode.error().find("dance"), std::string::npos);

    SettingsManager badOption;
    EXPECT_EQ(parseArgs(badOption, { "mirror", "--warp-speed" }), SettingsManager::ParseResult::ERROR);

    SettingsManager badNumber;
    EXPECT_EQ(parseArgs(badNumber, { "mirror", "--fps", "fast" }), SettingsManager::ParseResult::ERROR);

    SettingsManager badLevel;
    EXPECT_EQ(parseArgs(badLevel, { "mirror", "--log-level", "chatty" }), SettingsManager::ParseResult::ERROR);
}

TEST(SettingsManager, OutOfRangeValuesAreClamped) {
    SettingsManager manager;
    ASSERT_EQ(parseArgs(manager, { "leader", "--fps", "5000", "--smoothing", "1.5", "--max-step", "0" }),
              SettingsManager::ParseResult::OK);
    EXPECT_EQ(manager.settings().fps, MIRROR_MAX_FPS);
    EXPECT_DOUBLE_EQ(manager.settings().smoothing, 0.99);
    EXPECT_EQ(manager.settings().maxStep, 1);
    EXPECT_EQ(manager.clampAll(), 0);
}

TEST(SettingsManager, MotorIdLists) {
    std::vector<uint8_t> ids;
    std::string error;
    ASSERT_TRUE(SettingsManager::parseMotorIds(" 6,5 ,4", ids, &error));
    EXPECT_EQ(ids, (std::vector<uint8_t>{ 6, 5, 4 }));

    EXPECT_FALSE(SettingsManager::parseMotorIds("", ids, &error));
    EXPECT_FALSE(SettingsManager::parseMotorIds("1,x", ids, &error));
    EXPECT_FALSE(SettingsManager::parseMotorIds("1,254", ids, &error));
    EXPECT_FALSE(SettingsManager::parseMotorIds("1,2,1", ids, &error));
    EXPECT_NE(error.find("twice"), std::string::npos);
    EXPECT_EQ(ids, (std::vector<uint8_t>{ 6, 5, 4 }));
}

TEST(SettingsManager, LoadsJsonSettings) {
    SettingsManager manager;
    ASSERT_TRUE(manager.loadJson(R"({
        "ports": ["/dev/ttyACM0"],
        "motor_ids": [1, 2],
        "fps": 30,
        "smoothing": 0.5,
        "relay_port": 7500,
        "calibration_check": false,
        "unknown_key": true
    })"));
    const Settings& s = manager.settings();
    EXPECT_EQ(s.ports, (std::vector<std::string>{ "/dev/ttyACM0" }));
    EXPECT_EQ(s.motorIds, (std::vector<uint8_t>{ 1, 2 }));
    EXPECT_EQ(s.fps, 30);
    EXPECT_DOUBLE_EQ(s.smoothing, 0.5);
    EXPECT_EQ(s.relayPort, 7500);
    EXPECT_FALSE(s.calibrationCheck);

    ASSERT_TRUE(manager.loadJson(R"({"motor_ids": "3,4"})"));
    EXPECT_EQ(manager.settings().motorIds, (std::vector<uint8_t>{ 3, 4 }));
}

TEST(SettingsManager, RejectsMistypedJson) {
    SettingsManager manager;
    EXPECT_FALSE(manager.loadJson(R"({"fps": "sixty"})"));
    EXPECT_NE(manager.error().find("fps"), std::string::npos);
    EXPECT_FALSE(manager.loadJson(R"({"ports": "/dev/ttyUSB0"})"));
    EXPECT_FALSE(manager.loadJson("[1,2]"));
    EXPECT_FALSE(manager.loadJson("{"));
    // Nothing partially applied
    EXPECT_EQ(manager.settings().fps, MIRROR_TARGET_FPS);
}

class SettingsFileTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               (std::string("armmirror_settings_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

TEST_F(SettingsFileTest, CommandLineOverridesFile) {
    {
        std::ofstream out(path);
        out << R"({"fps": 30, "relay_host": "192.168.1.20", "max_step": 50})";
    }
    SettingsManager manager;
    ASSERT_EQ(parseArgs(manager, { "leader", "--config", path.c_str(), "--fps", "90" }),
              SettingsManager::ParseResult::OK);
    EXPECT_EQ(manager.settings().fps, 90);
    EXPECT_EQ(manager.settings().relayHost, "192.168.1.20");
    EXPECT_EQ(manager.settings().maxStep, 50);
}

TEST_F(SettingsFileTest, SavedSettingsLoadBack) {
    SettingsManager first;
    ASSERT_EQ(parseArgs(first, { "mirror", "--motor-ids", "2,4,6", "--fps", "45", "--node-id", "bench" }),
              SettingsManager::ParseResult::OK);
    ASSERT_TRUE(first.saveFile(path.string()));

    SettingsManager second;
    ASSERT_TRUE(second.loadFile(path.string()));
    EXPECT_EQ(second.settings().motorIds, (std::vector<uint8_t>{ 2, 4, 6 }));
    EXPECT_EQ(second.settings().fps, 45);
    EXPECT_EQ(second.settings().nodeId, "bench");
}

TEST_F(SettingsFileTest, MissingFileIsAnError) {
    SettingsManager manager;
    EXPECT_EQ(parseArgs(manager, { "mirror", "--config", path.c_str() }), SettingsManager::ParseResult::ERROR);
    EXPECT_NE(manager.error().find(path.string()), std::string::npos);
}
