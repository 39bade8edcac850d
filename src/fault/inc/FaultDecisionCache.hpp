#pragma once

#include "FaultInjector.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

// Per-worker memo over FaultInjector::decide. Never shared between threads.
// Bounded: the whole map is dropped when it reaches capacity.
class FaultDecisionCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1 << 16;

    explicit FaultDecisionCache(const FaultInjector& injector, size_t capacity = DEFAULT_CAPACITY);

    FaultState decide(const std::string& module_id, Timestamp timestamp);

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    struct Key {
        std::string module_id;
        int64_t bucket;

        bool operator==(const Key& other) const {
            return bucket == other.bucket && module_id == other.module_id;
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const;
    };

    const FaultInjector& injector_;
    size_t capacity_;
    std::unordered_map<Key, FaultState, KeyHash> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};
