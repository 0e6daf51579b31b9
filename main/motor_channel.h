#pragma once

// =============================================================================
// Motor Channel Module
// =============================================================================
// One servo bus (one arm) plus the worker thread that owns it. All bus
// transactions for the channel are posted to that worker, so reads and
// writes on one bus are strictly sequential while different arms run in
// parallel.
//
// Usage:
//   MotorChannel ch(std::unique_ptr<MotorBus>(new FeetechBus(port, baud, 20)), ids, 4096);
//   ch.open();                                   // Opens the bus, starts the worker
//   auto f = ch.readPositionsAsync();            // Runs on the worker
//   PositionMap pos = f.get();
//   ch.writePositions(pos);
//   ch.close();
// =============================================================================

#include "motor_bus.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Motor id -> raw position ticks
typedef std::map<uint8_t, int> PositionMap;

enum class Role {
    UNKNOWN,
    LEADER,
    FOLLOWER
};

const char* roleName(Role role);

class MotorChannel {
public:
    MotorChannel(std::unique_ptr<MotorBus> bus, const std::vector<uint8_t>& motorIds, int resolution);
    ~MotorChannel();

    MotorChannel(const MotorChannel&) = delete;
    MotorChannel& operator=(const MotorChannel&) = delete;

    // Open the bus and start the worker thread.
    bool open();

    // Drain pending work, stop the worker and close the bus. Idempotent.
    void close();

    bool isOpen() const;

    // ---- Identity ----
    const std::string& port() const;
    const std::vector<uint8_t>& motorIds() const { return _motorIds; }
    int resolution() const { return _resolution; }

    Role role() const { return _role; }
    const std::string& label() const { return _label; }
    void assign(Role role, const std::string& label);

    // ---- Worker dispatch ----

    // Run fn(MotorBus&) on the worker thread. If the worker is not running,
    // fn runs inline on the caller's thread.
    template <typename F>
    auto submit(F fn) -> std::future<decltype(fn(std::declval<MotorBus&>()))> {
        typedef decltype(fn(std::declval<MotorBus&>())) R;
        MotorBus* bus = _bus.get();
        auto task = std::make_shared<std::packaged_task<R()>>([fn, bus]() mutable { return fn(*bus); });
        std::future<R> result = task->get_future();
        if (_running) {
            boost::asio::post(_worker, [task]() { (*task)(); });
        } else {
            (*task)();
        }
        return result;
    }

    // ---- Position I/O ----

    // Read Present_Position of every motor. Failed ids are absent from the map.
    PositionMap readPositions();
    std::future<PositionMap> readPositionsAsync();

    // Write Goal_Position for every entry. Returns the number of successful writes.
    size_t writePositions(const PositionMap& positions);
    std::future<size_t> writePositionsAsync(const PositionMap& positions);

    // ---- Device Setup ----

    // Ping every configured id; returns the ids that did not answer.
    std::vector<uint8_t> findUnresponsive();

    // Torque_Enable=1 and Lock=1 on every motor. Returns false if any failed.
    bool enableTorque();

    // Supply voltage from the probe motor (negative on failure)
    float readVoltage(uint8_t probeId);

    // ---- Counters ----
    uint32_t readErrors() const { return _readErrors; }
    uint32_t writeErrors() const { return _writeErrors; }

private:
    std::unique_ptr<MotorBus> _bus;
    std::vector<uint8_t> _motorIds;
    int _resolution;

    Role _role = Role::UNKNOWN;
    std::string _label;

    boost::asio::io_context _worker;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _workGuard;
    std::thread _thread;
    std::atomic<bool> _running;

    std::atomic<uint32_t> _readErrors;
    std::atomic<uint32_t> _writeErrors;

    // Ids currently failing (worker thread only). Used to log transitions once.
    std::map<uint8_t, bool> _failing;

    PositionMap doReadPositions(MotorBus& bus);
    size_t doWritePositions(MotorBus& bus, const PositionMap& positions);
    void noteResult(uint8_t id, const char* what, BusResult result);
};
