#pragma once

// =============================================================================
// Loop Timer
// =============================================================================
// Fixed-rate scheduling for the control loops, the host-side equivalent of
// vTaskDelayUntil(): each cycle sleeps until an absolute deadline that
// advances by exactly one period, so jitter in one cycle does not
// accumulate. If a cycle overruns by more than a whole period the schedule
// is resynced to "now" instead of bursting to catch up.
//
// Usage:
//   LoopTimer timer(60);
//   timer.start();
//   while (running) { doWork(); timer.waitNext(); }
// =============================================================================

#include <stdint.h>
#include <chrono>

class LoopTimer {
public:
    explicit LoopTimer(int fps);

    void start();

    // Sleep until the next deadline. Returns false if the cycle overran.
    bool waitNext();

    std::chrono::microseconds period() const { return _period; }
    uint32_t overruns() const { return _overruns; }
    uint32_t cycles() const { return _cycles; }

    // Work time of the last cycle (start-of-cycle to waitNext), in ms
    double lastWorkMs() const { return _lastWorkMs; }

private:
    typedef std::chrono::steady_clock Clock;

    std::chrono::microseconds _period;
    Clock::time_point _deadline;
    Clock::time_point _cycleStart;
    uint32_t _overruns = 0;
    uint32_t _cycles = 0;
    double _lastWorkMs = 0.0;
};
