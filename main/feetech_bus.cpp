// =============================================================================
// Feetech Serial Bus - Implementation
// =============================================================================
// Blocking request/reply over boost::asio::serial_port. Reads are issued
// asynchronously and bounded with io_context::run_for() so a silent servo
// can never stall the caller for longer than the reply timeout.
// =============================================================================

#include "feetech_bus.h"
#include "config.h"
#include "debug_log.h"

#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>

#include <termios.h>

static const char* TAG = "Bus";

FeetechBus::FeetechBus(const std::string& port, unsigned int baud, unsigned int replyTimeoutMs)
    : _port(port),
      _baud(baud),
      _replyTimeout(replyTimeoutMs),
      _serial(_io) {
}

FeetechBus::~FeetechBus() {
    close();
}

bool FeetechBus::open() {
    if (_serial.is_open()) {
        return true;
    }

    boost::system::error_code ec;
    _serial.open(_port, ec);
    if (ec) {
        LOG_ERROR(TAG, "%s: open failed: %s", _port.c_str(), ec.message().c_str());
        return false;
    }

    using boost::asio::serial_port_base;
    _serial.set_option(serial_port_base::baud_rate(_baud), ec);
    if (!ec) { _serial.set_option(serial_port_base::character_size(8), ec); }
    if (!ec) { _serial.set_option(serial_port_base::parity(serial_port_base::parity::none), ec); }
    if (!ec) { _serial.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec); }
    if (!ec) { _serial.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec); }
    if (ec) {
        LOG_ERROR(TAG, "%s: configure failed (baud %u): %s", _port.c_str(), _baud, ec.message().c_str());
        boost::system::error_code ignored;
        _serial.close(ignored);
        return false;
    }

    flushInput();
    LOG_INFO(TAG, "%s: opened at %u baud (reply timeout %ld ms)",
             _port.c_str(), _baud, (long)_replyTimeout.count());
    return true;
}

void FeetechBus::close() {
    if (!_serial.is_open()) {
        return;
    }
    boost::system::error_code ec;
    _serial.close(ec);
    if (ec) {
        LOG_WARN(TAG, "%s: close: %s", _port.c_str(), ec.message().c_str());
    } else {
        LOG_INFO(TAG, "%s: closed", _port.c_str());
    }
}

bool FeetechBus::isOpen() const {
    return _serial.is_open();
}

const std::string& FeetechBus::port() const {
    return _port;
}

bool FeetechBus::ping(uint8_t id) {
    FeetechStatus status;
    BusResult result = transact(feetechBuildPing(id), id, status);
    // A servo reporting an error bit (e.g. overload) is still present
    return result == BusResult::OK || result == BusResult::DEVICE_ERROR;
}

BusResult FeetechBus::readRegister(uint8_t id, const MotorRegister& reg, uint16_t& value) {
    FeetechStatus status;
    BusResult result = transact(feetechBuildRead(id, reg), id, status);
    if (result != BusResult::OK) {
        return result;
    }
    if (status.params.size() < reg.size) {
        LOG_DEBUG(TAG, "%s: id %d %s short reply (%d bytes)",
                  _port.c_str(), id, reg.name, (int)status.params.size());
        return BusResult::CORRUPT;
    }
    value = feetechDecodeValue(status.params, reg.size);
    return BusResult::OK;
}

BusResult FeetechBus::writeRegister(uint8_t id, const MotorRegister& reg, uint16_t value) {
    FeetechStatus status;
    return transact(feetechBuildWrite(id, reg, value), id, status);
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

BusResult FeetechBus::transact(const std::vector<uint8_t>& packet, uint8_t id, FeetechStatus& status) {
    if (!_serial.is_open()) {
        return BusResult::NOT_OPEN;
    }

    _rx.clear();

    boost::system::error_code ec;
    boost::asio::write(_serial, boost::asio::buffer(packet), ec);
    if (ec) {
        LOG_ERROR(TAG, "%s: write failed: %s", _port.c_str(), ec.message().c_str());
        return BusResult::IO_ERROR;
    }

    const auto deadline = std::chrono::steady_clock::now() + _replyTimeout;
    uint8_t chunk[64];

    for (;;) {
        // Resync on the 0xFF 0xFF header, dropping any leading noise
        while (_rx.size() >= 2 && !(_rx[0] == FEETECH_HEADER && _rx[1] == FEETECH_HEADER)) {
            _rx.erase(_rx.begin());
        }

        size_t consumed = 0;
        FeetechParse parsed = feetechParseStatus(_rx.data(), _rx.size(), status, &consumed);
        if (parsed == FeetechParse::OK) {
            _rx.erase(_rx.begin(), _rx.begin() + consumed);
            if (status.id != id) {
                // Stale reply from an earlier timed-out transaction
                continue;
            }
            return status.error != 0 ? BusResult::DEVICE_ERROR : BusResult::OK;
        }
        if (parsed == FeetechParse::CORRUPT) {
            flushInput();
            return BusResult::CORRUPT;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            flushInput();
            return BusResult::TIMEOUT;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) {
            remaining = std::chrono::milliseconds(1);
        }
        size_t n = readSome(chunk, sizeof(chunk), remaining, ec);
        if (ec == boost::asio::error::timed_out) {
            flushInput();
            return BusResult::TIMEOUT;
        }
        if (ec) {
            LOG_ERROR(TAG, "%s: read failed: %s", _port.c_str(), ec.message().c_str());
            return BusResult::IO_ERROR;
        }
        _rx.insert(_rx.end(), chunk, chunk + n);
    }
}

size_t FeetechBus::readSome(uint8_t* buf, size_t len, std::chrono::milliseconds timeout,
                            boost::system::error_code& ec) {
    size_t bytes = 0;
    ec = boost::asio::error::would_block;

    _serial.async_read_some(boost::asio::buffer(buf, len),
        [&ec, &bytes](const boost::system::error_code& err, size_t n) {
            ec = err;
            bytes = n;
        });

    _io.restart();
    _io.run_for(timeout);

    if (!_io.stopped()) {
        // Still waiting: cancel and let the aborted handler run
        _serial.cancel(ec);
        _io.run();
    }

    if (ec == boost::asio::error::operation_aborted) {
        ec = boost::asio::error::timed_out;
        return 0;
    }
    return bytes;
}

void FeetechBus::flushInput() {
    _rx.clear();
    if (_serial.is_open()) {
        if (::tcflush(_serial.native_handle(), TCIFLUSH) != 0) {
            LOG_DEBUG(TAG, "%s: tcflush failed", _port.c_str());
        }
    }
}
