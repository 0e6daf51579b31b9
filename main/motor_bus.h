#pragma once

// =============================================================================
// Motor Bus Interface
// =============================================================================
// Register-level access to one physical servo bus (one USB serial adapter).
// FeetechBus implements it over a serial port; tests use an in-memory fake.
//
// Transactions are blocking and NOT thread-safe: a bus is owned by exactly
// one MotorChannel worker, which serializes all access (the bus is
// half-duplex).
// =============================================================================

#include <stdint.h>
#include <string>

#include "feetech_protocol.h"

enum class BusResult {
    OK,
    TIMEOUT,        // No status reply within the reply timeout
    CORRUPT,        // Reply failed header/length/checksum validation
    DEVICE_ERROR,   // Reply carried a non-zero error byte
    IO_ERROR,       // Port write/read failed (adapter unplugged?)
    NOT_OPEN
};

const char* busResultName(BusResult result);

class MotorBus {
public:
    virtual ~MotorBus() {}

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Port identity (e.g. "/dev/ttyUSB0")
    virtual const std::string& port() const = 0;

    virtual bool ping(uint8_t id) = 0;
    virtual BusResult readRegister(uint8_t id, const MotorRegister& reg, uint16_t& value) = 0;
    virtual BusResult writeRegister(uint8_t id, const MotorRegister& reg, uint16_t value) = 0;

    // ---- Helpers built on the register primitives ----

    BusResult readRaw(uint8_t id, int& raw);
    BusResult writeRaw(uint8_t id, int raw);

    // Supply voltage in volts. Returns a negative value on failure.
    float readVoltage(uint8_t id);
};
