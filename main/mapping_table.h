#pragma once

// =============================================================================
// Mapping Table Module
// =============================================================================
// Which follower arm mirrors which leader arm. Always a bijection between the
// leader labels and follower labels; the only mutation is swapping the
// followers of two pairs, so it can never become non-bijective.
//
// The control loop takes a snapshot() at the top of each cycle; remaps are
// posted to a RemapQueue from other threads (keyboard) and applied by the
// loop between cycles, so no cycle ever sees a half-applied swap.
//
// Usage:
//   MappingTable table;
//   table.begin({"Leader1","Leader2"}, {"Follower1","Follower2"}, false);
//   remapQueue.post(0, 1);                    // from the keyboard thread
//   remapQueue.drainInto(table);              // from the loop, between cycles
//   std::vector<MappingPair> pairs = table.snapshot();
// =============================================================================

#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct MappingPair {
    std::string leader;
    std::string follower;
};

class MappingTable {
public:
    // Pair leaders[i] with followers[i] (or a random bijection when shuffle).
    // Returns false if the label lists differ in size or contain duplicates.
    bool begin(const std::vector<std::string>& leaders,
               const std::vector<std::string>& followers,
               bool shuffle);

    // Swap the followers of pairs i and j. Returns false if out of range.
    bool remap(size_t i, size_t j);

    // Swap the followers currently mapped from two leader labels.
    bool remapLeaders(const std::string& leaderA, const std::string& leaderB);

    std::vector<MappingPair> snapshot() const;

    // Follower label mapped from this leader ("" if none)
    std::string followerFor(const std::string& leader) const;

    size_t size() const;
    bool isBijection() const;

    // "Leader1->Follower2, Leader2->Follower1"
    std::string describe() const;

private:
    mutable std::mutex _mutex;
    std::vector<MappingPair> _pairs;

    static bool checkBijection(const std::vector<MappingPair>& pairs);
};

// Remap requests from any thread, applied by the loop at a cycle boundary.
class RemapQueue {
public:
    void post(size_t i, size_t j);

    // Apply all pending requests. Returns the number applied.
    int drainInto(MappingTable& table);

    bool empty() const;

private:
    mutable std::mutex _mutex;
    std::deque<std::pair<size_t, size_t>> _pending;
};
