#pragma once

#include "TimestampUtils.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class FaultKind {
    None,
    LinkFlap,
    HighTemperature,
    HighErrorRate,
    LowRxPower,
    VoltageDrift
};

const char* fault_kind_to_string(FaultKind kind);

// "none", "link_flap", ... for schema domains
const std::vector<std::string>& fault_kind_names();

struct FaultState {
    FaultKind kind = FaultKind::None;
    double severity = 0.0;

    bool anomalous() const { return kind != FaultKind::None; }
};

// Decides whether a key is anomalous at a time. The decision is a pure function of
// (run seed, module_id, time bucket) so every table sees the same faults for the same
// key and instant without sharing state between workers.
class FaultInjector {
public:
    static constexpr int64_t DEFAULT_BUCKET_SECONDS = 1800;

    FaultInjector(uint64_t run_seed, double fault_ratio, int64_t bucket_seconds = DEFAULT_BUCKET_SECONDS);

    FaultState decide(const std::string& module_id, Timestamp timestamp) const;
    FaultState decide(const std::string& module_id, Timestamp timestamp, double fault_ratio) const;

    double fault_ratio() const { return fault_ratio_; }
    uint64_t run_seed() const { return run_seed_; }
    int64_t bucket_seconds() const { return bucket_seconds_; }
    int64_t bucket_of(Timestamp timestamp) const;

    // Throws ConfigurationError(field "fault_ratio") for NaN or values outside [0, 1]
    static void validate_ratio(double fault_ratio);

private:
    FaultState decide_bucket(uint64_t key_hash, int64_t bucket, double fault_ratio) const;

    uint64_t run_seed_;
    double fault_ratio_;
    int64_t bucket_seconds_;

    friend class FaultDecisionCache;
};
