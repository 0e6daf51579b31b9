// =============================================================================
// Calibration engine and store
// =============================================================================

#include "calibration.h"
#include "config.h"
#include "fake_motor_bus.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

static const std::vector<uint8_t> IDS = { 1, 2, 3 };

static bool confirmNow() { return true; }

TEST(CalibrationEngine, OffsetCentresTheMiddlePose) {
    EXPECT_EQ(CalibrationEngine::computeOffset(3000, 4096), 952);
    EXPECT_EQ(CalibrationEngine::computeOffset(1000, 4096), -1048);
    EXPECT_EQ(CalibrationEngine::computeOffset(2048, 4096), 0);
}

TEST(CalibrationEngine, OffsetMagnitudeStaysBelowHalfResolution) {
    EXPECT_LT(std::abs(CalibrationEngine::computeOffset(4095, 4096)), 2048);
    EXPECT_LT(std::abs(CalibrationEngine::computeOffset(0, 4096)), 2048);
}

TEST(CalibrationEngine, OffsetFitsTheRegisterAtHighResolution) {
    EXPECT_EQ(CalibrationEngine::computeOffset(8000, 8192), 2047);
    EXPECT_EQ(CalibrationEngine::computeOffset(100, 8192), -2047);
    EXPECT_EQ(CalibrationEngine::computeOffset(5000, 8192), 904);
}

TEST(CalibrationEngine, RecordMatchesDeviceWhenOffsetIsClamped) {
    FakeMotorBus bus("/dev/ttyUSB0", IDS, 12.0f, 8192);
    bus.setPhysical(1, 8000);

    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult r = engine.calibrate(bus, IDS, Role::FOLLOWER, 8192, confirmNow);

    ASSERT_TRUE(r.complete);
    EXPECT_EQ(r.record.homeOffsets.at(1), 2047);
    EXPECT_EQ(decodeSignMagnitude(bus.reg(1, FeetechReg::HOMING_OFFSET), HOMING_OFFSET_SIGN_BIT),
              r.record.homeOffsets.at(1));
    EXPECT_EQ(engine.verifyDevice(bus, r.record), 0);
}

TEST(CalibrationEngine, WritesOffsetsAndReadsCentredAfterwards) {
    FakeMotorBus bus("/dev/ttyUSB0", IDS, 5.0f);
    bus.setPhysical(1, 3000);
    bus.setPhysical(2, 1000);
    bus.setPhysical(3, 2048);

    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult r = engine.calibrate(bus, IDS, Role::LEADER, 4096, confirmNow);

    ASSERT_TRUE(r.complete);
    EXPECT_EQ(r.record.homeOffsets.at(1), 952);
    EXPECT_EQ(r.record.homeOffsets.at(2), -1048);
    EXPECT_EQ(r.record.homeOffsets.at(3), 0);
    EXPECT_EQ(decodeSignMagnitude(bus.reg(2, FeetechReg::HOMING_OFFSET), HOMING_OFFSET_SIGN_BIT), -1048);

    for (uint8_t id : IDS) {
        int raw = 0;
        ASSERT_EQ(bus.readRaw(id, raw), BusResult::OK);
        EXPECT_EQ(raw, 2048);
    }
    EXPECT_EQ(bus.reg(1, FeetechReg::PHASE), DEFAULT_LEADER_PHASE);
    EXPECT_EQ(bus.reg(1, FeetechReg::MAX_POSITION_LIMIT), 4095);
    EXPECT_NEAR(r.record.voltage, 5.0, 0.05);
}

TEST(CalibrationEngine, IsIdempotentForTheSamePose) {
    FakeMotorBus bus("/dev/ttyUSB1", IDS, 12.0f);
    bus.setPhysical(1, 3500);
    bus.setPhysical(2, 700);
    bus.setPhysical(3, 2100);

    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult first = engine.calibrate(bus, IDS, Role::FOLLOWER, 4096, confirmNow);
    CalibrationResult second = engine.calibrate(bus, IDS, Role::FOLLOWER, 4096, confirmNow);

    ASSERT_TRUE(first.complete);
    ASSERT_TRUE(second.complete);
    EXPECT_EQ(first.record.homeOffsets, second.record.homeOffsets);
    EXPECT_EQ(bus.reg(1, FeetechReg::PHASE), DEFAULT_FOLLOWER_PHASE);
}

TEST(CalibrationEngine, PreparesEachMotorInOrder) {
    FakeMotorBus bus("/dev/ttyUSB0", { 1 }, 5.0f);
    CalibrationEngine engine(CalibrationSettings::defaults());
    engine.calibrate(bus, { 1 }, Role::LEADER, 4096, confirmNow);

    std::vector<FakeWrite> writes = bus.writes();
    std::vector<std::string> names;
    for (const FakeWrite& w : writes) {
        names.push_back(w.reg);
    }
    std::vector<std::string> expected = {
        "Lock", "Torque_Enable", "Phase", "Lock", "Operating_Mode",
        "Homing_Offset", "Min_Position_Limit", "Max_Position_Limit",
        "Homing_Offset", "Lock",
    };
    EXPECT_EQ(names, expected);
    EXPECT_EQ(writes[1].value, 0);      // torque off before anything else
}

TEST(CalibrationEngine, UnresponsiveMotorMakesItIncomplete) {
    FakeMotorBus bus("/dev/ttyUSB0", IDS, 5.0f);
    bus.setUnresponsive(2);

    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult r = engine.calibrate(bus, IDS, Role::LEADER, 4096, confirmNow);

    EXPECT_FALSE(r.complete);
    ASSERT_EQ(r.unresponsive.size(), 1u);
    EXPECT_EQ(r.unresponsive[0], 2);
    EXPECT_EQ(r.record.homeOffsets.count(1), 1u);
    EXPECT_EQ(r.record.homeOffsets.count(2), 0u);
}

TEST(CalibrationEngine, OperatorAbortWritesNoOffsets) {
    FakeMotorBus bus("/dev/ttyUSB0", IDS, 5.0f);
    bus.setPhysical(1, 3000);

    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult r = engine.calibrate(bus, IDS, Role::LEADER, 4096, []() { return false; });

    EXPECT_TRUE(r.aborted);
    EXPECT_FALSE(r.complete);
    EXPECT_TRUE(r.record.homeOffsets.empty());
}

TEST(CalibrationEngine, VerifyDeviceCountsDisagreements) {
    FakeMotorBus bus("/dev/ttyUSB0", IDS, 5.0f);
    bus.setPhysical(1, 3000);
    CalibrationEngine engine(CalibrationSettings::defaults());
    CalibrationResult r = engine.calibrate(bus, IDS, Role::LEADER, 4096, confirmNow);
    ASSERT_TRUE(r.complete);
    EXPECT_EQ(engine.verifyDevice(bus, r.record), 0);

    bus.setReg(1, FeetechReg::HOMING_OFFSET, 0);
    EXPECT_EQ(engine.verifyDevice(bus, r.record), 1);
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

static CalibrationRecord sampleRecord() {
    CalibrationRecord record;
    record.port = "/dev/ttyUSB0";
    record.role = Role::LEADER;
    record.motorIds = { 1, 2, 3 };
    record.homeOffsets[1] = 952;
    record.homeOffsets[2] = -1048;
    record.homeOffsets[3] = 0;
    record.resolution = 4096;
    record.timestampMs = 1760000000123LL;
    record.timestampStr = "2025-10-09 10:53:20";
    record.voltage = 5.1;
    return record;
}

TEST(CalibrationJson, RoundTripsExactly) {
    CalibrationRecord record = sampleRecord();
    CalibrationRecord back;
    ASSERT_TRUE(calibrationFromJson(calibrationToJson(record), back));
    EXPECT_EQ(back.port, record.port);
    EXPECT_EQ(back.role, record.role);
    EXPECT_EQ(back.motorIds, record.motorIds);
    EXPECT_EQ(back.homeOffsets, record.homeOffsets);
    EXPECT_EQ(back.resolution, record.resolution);
    EXPECT_EQ(back.timestampMs, record.timestampMs);
    EXPECT_EQ(back.timestampStr, record.timestampStr);
    EXPECT_DOUBLE_EQ(back.voltage, record.voltage);
}

TEST(CalibrationJson, MotorIdZeroLoadsBack) {
    CalibrationRecord record = sampleRecord();
    record.motorIds = { 0, 1 };
    record.homeOffsets.clear();
    record.homeOffsets[0] = -300;
    record.homeOffsets[1] = 12;

    CalibrationRecord back;
    ASSERT_TRUE(calibrationFromJson(calibrationToJson(record), back));
    EXPECT_EQ(back.motorIds, record.motorIds);
    EXPECT_EQ(back.homeOffsets, record.homeOffsets);
}

TEST(CalibrationJson, RejectsNonNumericOffsetKey) {
    const char* json = R"({"port":"/dev/ttyUSB0","role":"leader","motor_ids":[1],
        "home_positions":{"shoulder":10},"servo_resolution":4096})";
    CalibrationRecord out;
    EXPECT_FALSE(calibrationFromJson(json, out));
}

TEST(CalibrationJson, RejectsOutOfRangeOffset) {
    const char* json = R"({"port":"/dev/ttyUSB0","role":"leader","motor_ids":[1],
        "home_positions":{"1":2048},"servo_resolution":4096})";
    CalibrationRecord out;
    EXPECT_FALSE(calibrationFromJson(json, out));
}

TEST(CalibrationJson, RejectsMissingFields) {
    CalibrationRecord out;
    EXPECT_FALSE(calibrationFromJson(R"({"port":"/dev/ttyUSB0"})", out));
    EXPECT_FALSE(calibrationFromJson("not json", out));
}

class CalibrationStoreTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("armmirror_calib_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

TEST_F(CalibrationStoreTest, SavesUnderPortBasename) {
    CalibrationStore store(dir.string());
    EXPECT_EQ(store.pathFor("/dev/ttyUSB0"), (dir / "ttyUSB0.json").string());

    CalibrationRecord record = sampleRecord();
    ASSERT_TRUE(store.save(record));
    EXPECT_TRUE(std::filesystem::exists(dir / "ttyUSB0.json"));
    EXPECT_FALSE(std::filesystem::exists(dir / "ttyUSB0.json.tmp"));

    CalibrationRecord loaded;
    ASSERT_TRUE(store.load("/dev/ttyUSB0", loaded));
    EXPECT_EQ(loaded.homeOffsets, record.homeOffsets);
}

TEST_F(CalibrationStoreTest, MissingFileIsNotLoaded) {
    CalibrationStore store(dir.string());
    CalibrationRecord loaded;
    EXPECT_FALSE(store.load("/dev/ttyUSB9", loaded));
}

TEST(CalibrationCoverage, RequiresEveryIdRoleAndResolution) {
    CalibrationRecord record = sampleRecord();
    std::string reason;

    EXPECT_TRUE(CalibrationStore::covers(record, { 1, 2, 3 }, Role::LEADER, 4096, &reason));
    EXPECT_TRUE(reason.empty());

    EXPECT_FALSE(CalibrationStore::covers(record, { 1, 2, 3, 4 }, Role::LEADER, 4096, &reason));
    EXPECT_NE(reason.find("4"), std::string::npos);

    EXPECT_FALSE(CalibrationStore::covers(record, { 1, 2, 3 }, Role::FOLLOWER, 4096, &reason));
    EXPECT_FALSE(CalibrationStore::covers(record, { 1, 2, 3 }, Role::LEADER, 1024, &reason));
}
