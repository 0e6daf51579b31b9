// =============================================================================
// Loop Timer - Implementation
// =============================================================================

#include "loop_timer.h"

#include <thread>

LoopTimer::LoopTimer(int fps)
    : _period(1000000 / (fps > 0 ? fps : 1)) {
    start();
}

void LoopTimer::start() {
    _cycleStart = Clock::now();
    _deadline = _cycleStart;
    _cycles = 0;
    _overruns = 0;
}

bool LoopTimer::waitNext() {
    Clock::time_point now = Clock::now();
    _lastWorkMs = std::chrono::duration<double, std::milli>(now - _cycleStart).count();
    _cycles++;

    _deadline += _period;
    bool onTime = true;
    if (now > _deadline + _period) {
        // More than a full period late: resync rather than burst
        _overruns++;
        _deadline = now;
        onTime = false;
    } else if (now < _deadline) {
        std::this_thread::sleep_until(_deadline);
    }

    _cycleStart = Clock::now();
    return onTime;
}
