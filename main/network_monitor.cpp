// =============================================================================
// Network Monitor - Implementation
// =============================================================================

#include "network_monitor.h"

NetworkMonitor::NetworkMonitor(size_t rttSamples, size_t maxPending)
    : _rttSamples(rttSamples > 0 ? rttSamples : 1),
      _maxPending(maxPending > 0 ? maxPending : 1) {
}

void NetworkMonitor::recordSent(uint64_t sequence, int64_t sentUs) {
    std::lock_guard<std::mutex> lock(_mutex);
    _sent++;
    _pending[sequence] = sentUs;
    while (_pending.size() > _maxPending) {
        _pending.erase(_pending.begin());
    }
}

double NetworkMonitor::recordAck(uint64_t sequence, int64_t nowUs) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _pending.find(sequence);
    if (it == _pending.end()) {
        return -1.0;
    }

    double rttMs = (double)(nowUs - it->second) / 1000.0;
    if (rttMs < 0.0) {
        rttMs = 0.0;
    }
    _pending.erase(it);
    _acked++;

    _rtts.push_back(rttMs);
    while (_rtts.size() > _rttSamples) {
        _rtts.pop_front();
    }
    return rttMs;
}

NetworkStats NetworkMonitor::stats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    NetworkStats s;
    s.sent = _sent;
    s.acked = _acked;
    if (!_rtts.empty()) {
        double sum = 0.0;
        double maxRtt = 0.0;
        for (double rtt : _rtts) {
            sum += rtt;
            if (rtt > maxRtt) {
                maxRtt = rtt;
            }
        }
        s.avgRttMs = sum / (double)_rtts.size();
        s.maxRttMs = maxRtt;
    }
    if (_sent > 0) {
        s.lossRate = 1.0 - (double)_acked / (double)_sent;
    }
    return s;
}

void NetworkMonitor::reset() {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.clear();
    _rtts.clear();
    _sent = 0;
    _acked = 0;
}
