// =============================================================================
// Motor Bus Interface - Shared Helpers
// =============================================================================

#include "motor_bus.h"

const char* busResultName(BusResult result) {
    switch (result) {
        case BusResult::OK:           return "ok";
        case BusResult::TIMEOUT:      return "timeout";
        case BusResult::CORRUPT:      return "corrupt";
        case BusResult::DEVICE_ERROR: return "device-error";
        case BusResult::IO_ERROR:     return "io-error";
        case BusResult::NOT_OPEN:     return "not-open";
    }
    return "?";
}

BusResult MotorBus::readRaw(uint8_t id, int& raw) {
    uint16_t value = 0;
    BusResult result = readRegister(id, FeetechReg::PRESENT_POSITION, value);
    if (result == BusResult::OK) {
        raw = value;
    }
    return result;
}

BusResult MotorBus::writeRaw(uint8_t id, int raw) {
    if (raw < 0) { raw = 0; }
    if (raw > 0xFFFF) { raw = 0xFFFF; }
    return writeRegister(id, FeetechReg::GOAL_POSITION, (uint16_t)raw);
}

float MotorBus::readVoltage(uint8_t id) {
    uint16_t value = 0;
    if (readRegister(id, FeetechReg::PRESENT_VOLTAGE, value) != BusResult::OK) {
        return -1.0f;
    }
    return (float)value / 10.0f;
}
