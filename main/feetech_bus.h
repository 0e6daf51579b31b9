#pragma once

// =============================================================================
// Feetech Serial Bus
// =============================================================================
// MotorBus over a USB serial adapter using Boost.Asio's serial_port.
// Every instruction waits for its status reply with a bounded timeout; a
// timeout or corrupt reply flushes the receive buffer so the next
// transaction starts clean.
//
// Usage:
//   FeetechBus bus("/dev/ttyUSB0", 1000000, 20);
//   if (bus.open()) { int raw; bus.readRaw(1, raw); }
// =============================================================================

#include "motor_bus.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

#include <chrono>
#include <string>
#include <vector>

class FeetechBus : public MotorBus {
public:
    FeetechBus(const std::string& port, unsigned int baud, unsigned int replyTimeoutMs);
    ~FeetechBus() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;
    const std::string& port() const override;

    bool ping(uint8_t id) override;
    BusResult readRegister(uint8_t id, const MotorRegister& reg, uint16_t& value) override;
    BusResult writeRegister(uint8_t id, const MotorRegister& reg, uint16_t value) override;

private:
    std::string _port;
    unsigned int _baud;
    std::chrono::milliseconds _replyTimeout;

    boost::asio::io_context _io;
    boost::asio::serial_port _serial;

    std::vector<uint8_t> _rx;

    // Send one instruction and wait for the matching status reply.
    BusResult transact(const std::vector<uint8_t>& packet, uint8_t id, FeetechStatus& status);

    // Read whatever is available, waiting at most `timeout`. Returns 0 on timeout.
    size_t readSome(uint8_t* buf, size_t len, std::chrono::milliseconds timeout,
                    boost::system::error_code& ec);

    // Discard pending input (driver buffer and our partial buffer)
    void flushInput();
};
