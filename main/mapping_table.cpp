// =============================================================================
// Mapping Table Module - Implementation
// =============================================================================

#include "mapping_table.h"
#include "debug_log.h"

#include <algorithm>
#include <random>
#include <set>

static const char* TAG = "Mapping";

bool MappingTable::begin(const std::vector<std::string>& leaders,
                         const std::vector<std::string>& followers,
                         bool shuffle) {
    if (leaders.size() != followers.size()) {
        LOG_ERROR(TAG, "Can't pair %d leader(s) with %d follower(s)",
                  (int)leaders.size(), (int)followers.size());
        return false;
    }

    std::vector<std::string> order(followers);
    if (shuffle) {
        std::random_device rd;
        std::mt19937 rng(rd());
        std::shuffle(order.begin(), order.end(), rng);
    }

    std::vector<MappingPair> pairs;
    for (size_t i = 0; i < leaders.size(); i++) {
        pairs.push_back(MappingPair{leaders[i], order[i]});
    }
    if (!checkBijection(pairs)) {
        LOG_ERROR(TAG, "Duplicate labels in mapping");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _pairs = pairs;
    }
    LOG_INFO(TAG, "Initial mapping: %s", describe().c_str());
    return true;
}

bool MappingTable::remap(size_t i, size_t j) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (i >= _pairs.size() || j >= _pairs.size()) {
            LOG_WARN(TAG, "Remap %d<->%d ignored (%d pairs)", (int)i, (int)j, (int)_pairs.size());
            return false;
        }
        if (i == j) {
            return true;
        }
        std::swap(_pairs[i].follower, _pairs[j].follower);
    }
    LOG_INFO(TAG, "Remapped: %s", describe().c_str());
    return true;
}

bool MappingTable::remapLeaders(const std::string& leaderA, const std::string& leaderB) {
    size_t a = 0;
    size_t b = 0;
    bool foundA = false;
    bool foundB = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t k = 0; k < _pairs.size(); k++) {
            if (_pairs[k].leader == leaderA) { a = k; foundA = true; }
            if (_pairs[k].leader == leaderB) { b = k; foundB = true; }
        }
    }
    if (!foundA || !foundB) {
        LOG_WARN(TAG, "Remap %s<->%s: unknown leader", leaderA.c_str(), leaderB.c_str());
        return false;
    }
    return remap(a, b);
}

std::vector<MappingPair> MappingTable::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pairs;
}

std::string MappingTable::followerFor(const std::string& leader) const {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const MappingPair& pair : _pairs) {
        if (pair.leader == leader) {
            return pair.follower;
        }
    }
    return "";
}

size_t MappingTable::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pairs.size();
}

bool MappingTable::isBijection() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return checkBijection(_pairs);
}

std::string MappingTable::describe() const {
    std::vector<MappingPair> pairs = snapshot();
    std::string out;
    for (const MappingPair& pair : pairs) {
        if (!out.empty()) {
            out += ", ";
        }
        out += pair.leader + "->" + pair.follower;
    }
    return out;
}

bool MappingTable::checkBijection(const std::vector<MappingPair>& pairs) {
    std::set<std::string> leaders;
    std::set<std::string> followers;
    for (const MappingPair& pair : pairs) {
        if (!leaders.insert(pair.leader).second || !followers.insert(pair.follower).second) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// RemapQueue
// ---------------------------------------------------------------------------

void RemapQueue::post(size_t i, size_t j) {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.push_back(std::make_pair(i, j));
}

int RemapQueue::drainInto(MappingTable& table) {
    std::deque<std::pair<size_t, size_t>> pending;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        pending.swap(_pending);
    }
    int applied = 0;
    for (const auto& request : pending) {
        if (table.remap(request.first, request.second)) {
            applied++;
        }
    }
    return applied;
}

bool RemapQueue::empty() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.empty();
}
