#pragma once

// =============================================================================
// Position Smoother
// =============================================================================
// Exponential low-pass with a per-step limit for follower targets that
// arrive over the network:
//
//   next    = alpha * prev + (1 - alpha) * target
//   applied = prev + clamp(next - prev, -maxStep, +maxStep)
//
// State is kept per motor as a double so it converges to the target instead
// of stalling on integer rounding. Seed with the follower's present
// positions so the first message does not jump the arm.
//
// Usage:
//   PositionSmoother smoother(0.8, 200);
//   smoother.seed(presentPositions);
//   PositionMap out = smoother.smooth(targets);
// =============================================================================

#include "motor_channel.h"

#include <map>
#include <vector>

class PositionSmoother {
public:
    PositionSmoother(double alpha, int maxStep);

    // Set the current state (e.g. present positions). Overwrites existing ids.
    void seed(const PositionMap& positions);

    // Smooth each target against its previous value and update the state.
    // Unseeded ids are left out of the result until they are seeded.
    PositionMap smooth(const PositionMap& targets);

    // Ids in targets that have no state yet
    std::vector<uint8_t> unseeded(const PositionMap& targets) const;

    // One step for one value
    static double step(double prev, double target, double alpha, int maxStep);

    bool hasState(uint8_t id) const;
    double state(uint8_t id) const;
    void reset();

    double alpha() const { return _alpha; }
    int maxStep() const { return _maxStep; }

private:
    double _alpha;
    int _maxStep;
    std::map<uint8_t, double> _state;
};
