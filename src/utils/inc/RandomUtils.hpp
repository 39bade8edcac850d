#pragma once

#include "pcg_random.hpp"
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace RandomUtils {

// splitmix64 finalizer, used to derive independent seeds from a run seed
inline uint64_t mix(uint64_t value) {
    value += 0x9E3779B97F4A7C15ULL;
    value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
    value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
    return value ^ (value >> 31);
}

inline uint64_t combine(uint64_t a, uint64_t b) {
    return mix(a ^ mix(b));
}

// 64-bit FNV-1a
inline uint64_t hash_string(const std::string& text) {
    uint64_t hash = 0xCBF29CE484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001B3ULL;
    }
    return hash;
}

// Random seed for runs that did not supply one
inline uint64_t draw_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

// [0, 1) from a single 32-bit draw
inline double unit(pcg32& rng) {
    return static_cast<double>(rng()) / 4294967296.0;
}

inline double uniform(pcg32& rng, double lo, double hi) {
    return lo + (hi - lo) * unit(rng);
}

inline int64_t uniform_int(pcg32& rng, int64_t lo, int64_t hi) {
    if (hi <= lo) return lo;
    uint64_t span = static_cast<uint64_t>(hi - lo) + 1;
    uint64_t draw = (static_cast<uint64_t>(rng()) << 32) | rng();
    return lo + static_cast<int64_t>(draw % span);
}

inline double normal(pcg32& rng, double mean, double stddev) {
    std::normal_distribution<double> dist(mean, stddev);
    return dist(rng);
}

// Normal draw redrawn until it lies within `limit` standard deviations of the mean
inline double truncated_normal(pcg32& rng, double mean, double stddev, double limit = 3.0) {
    std::normal_distribution<double> dist(0.0, 1.0);
    double z = dist(rng);
    while (std::abs(z) > limit) {
        z = dist(rng);
    }
    return mean + stddev * z;
}

// value +- at most value/divisor, so a non-negative size never goes below zero
inline int64_t jitter_size(pcg32& rng, int64_t value, int64_t divisor, int64_t cap) {
    int64_t spread = value / divisor < cap ? value / divisor : cap;
    return value + uniform_int(rng, -spread, spread);
}

inline bool chance(pcg32& rng, double probability) {
    return unit(rng) < probability;
}

template <typename T>
const T& pick(pcg32& rng, const std::vector<T>& items) {
    if (items.empty()) {
        throw std::invalid_argument("RandomUtils::pick on an empty list");
    }
    return items[rng(static_cast<uint32_t>(items.size()))];
}

// Index drawn proportionally to weights
inline size_t weighted_index(pcg32& rng, const std::vector<double>& weights) {
    double total = 0.0;
    for (double w : weights) total += w;
    if (weights.empty() || total <= 0.0) {
        throw std::invalid_argument("RandomUtils::weighted_index needs positive weights");
    }

    double target = unit(rng) * total;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (target < weights[i]) return i;
        target -= weights[i];
    }
    return weights.size() - 1;
}

}
