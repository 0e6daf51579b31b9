// =============================================================================
// Position Smoother - Implementation
// =============================================================================

#include "position_smoother.h"

#include <cmath>

PositionSmoother::PositionSmoother(double alpha, int maxStep)
    : _alpha(alpha),
      _maxStep(maxStep) {
    if (_alpha < 0.0) { _alpha = 0.0; }
    if (_alpha > 0.99) { _alpha = 0.99; }
    if (_maxStep < 1) { _maxStep = 1; }
}

void PositionSmoother::seed(const PositionMap& positions) {
    for (const auto& entry : positions) {
        _state[entry.first] = (double)entry.second;
    }
}

double PositionSmoother::step(double prev, double target, double alpha, int maxStep) {
    double next = alpha * prev + (1.0 - alpha) * target;
    double delta = next - prev;
    if (delta > maxStep) {
        delta = maxStep;
    } else if (delta < -maxStep) {
        delta = -maxStep;
    }
    return prev + delta;
}

PositionMap PositionSmoother::smooth(const PositionMap& targets) {
    PositionMap out;
    for (const auto& entry : targets) {
        auto it = _state.find(entry.first);
        if (it == _state.end()) {
            continue;
        }
        it->second = step(it->second, (double)entry.second, _alpha, _maxStep);
        out[entry.first] = (int)std::lround(it->second);
    }
    return out;
}

std::vector<uint8_t> PositionSmoother::unseeded(const PositionMap& targets) const {
    std::vector<uint8_t> ids;
    for (const auto& entry : targets) {
        if (_state.find(entry.first) == _state.end()) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

bool PositionSmoother::hasState(uint8_t id) const {
    return _state.find(id) != _state.end();
}

double PositionSmoother::state(uint8_t id) const {
    auto it = _state.find(id);
    return it == _state.end() ? 0.0 : it->second;
}

void PositionSmoother::reset() {
    _state.clear();
}
