#include "FaultInjector.hpp"
#include "RandomUtils.hpp"
#include "TelgenErrors.hpp"
#include <cmath>

namespace {

struct KindProfile {
    FaultKind kind;
    double weight;
    double min_severity;
    double max_severity;
};

const std::vector<KindProfile>& kind_profiles() {
    static const std::vector<KindProfile> profiles = {
        {FaultKind::LinkFlap,        0.20, 0.5, 1.0},
        {FaultKind::HighTemperature, 0.25, 0.3, 1.0},
        {FaultKind::HighErrorRate,   0.25, 0.2, 1.0},
        {FaultKind::LowRxPower,      0.20, 0.3, 1.0},
        {FaultKind::VoltageDrift,    0.10, 0.2, 0.8}
    };
    return profiles;
}

const std::vector<double>& kind_weights() {
    static const std::vector<double> weights = [] {
        std::vector<double> w;
        for (const auto& p : kind_profiles()) w.push_back(p.weight);
        return w;
    }();
    return weights;
}

}

const char* fault_kind_to_string(FaultKind kind) {
    switch (kind) {
        case FaultKind::None:            return "none";
        case FaultKind::LinkFlap:        return "link_flap";
        case FaultKind::HighTemperature: return "high_temperature";
        case FaultKind::HighErrorRate:   return "high_error_rate";
        case FaultKind::LowRxPower:      return "low_rx_power";
        case FaultKind::VoltageDrift:    return "voltage_drift";
        default: return "none";
    }
}

const std::vector<std::string>& fault_kind_names() {
    static const std::vector<std::string> names = {
        "none", "link_flap", "high_temperature", "high_error_rate", "low_rx_power", "voltage_drift"
    };
    return names;
}

FaultInjector::FaultInjector(uint64_t run_seed, double fault_ratio, int64_t bucket_seconds)
    : run_seed_(run_seed), fault_ratio_(fault_ratio), bucket_seconds_(bucket_seconds) {
    validate_ratio(fault_ratio);
    if (bucket_seconds <= 0) {
        throw ConfigurationError("fault_bucket", "bucket length must be positive");
    }
}

void FaultInjector::validate_ratio(double fault_ratio) {
    if (std::isnan(fault_ratio) || fault_ratio < 0.0 || fault_ratio > 1.0) {
        throw ConfigurationError("fault_ratio", "must be within [0, 1], got " + std::to_string(fault_ratio));
    }
}

int64_t FaultInjector::bucket_of(Timestamp timestamp) const {
    return TimestampUtils::floor_div(timestamp, bucket_seconds_);
}

FaultState FaultInjector::decide(const std::string& module_id, Timestamp timestamp) const {
    return decide_bucket(RandomUtils::hash_string(module_id), bucket_of(timestamp), fault_ratio_);
}

FaultState FaultInjector::decide(const std::string& module_id, Timestamp timestamp, double fault_ratio) const {
    validate_ratio(fault_ratio);
    return decide_bucket(RandomUtils::hash_string(module_id), bucket_of(timestamp), fault_ratio);
}

FaultState FaultInjector::decide_bucket(uint64_t key_hash, int64_t bucket, double fault_ratio) const {
    if (fault_ratio <= 0.0) {
        return FaultState{};
    }

    // The draw does not depend on the ratio, so a higher ratio only adds faults
    uint64_t key_seed = RandomUtils::combine(run_seed_, key_hash);
    pcg32 rng(RandomUtils::combine(key_seed, static_cast<uint64_t>(bucket)), static_cast<uint64_t>(bucket));
    double u = RandomUtils::unit(rng);
    if (u >= fault_ratio) {
        return FaultState{};
    }

    const KindProfile& profile = kind_profiles()[RandomUtils::weighted_index(rng, kind_weights())];
    double severity = RandomUtils::uniform(rng, profile.min_severity, profile.max_severity);
    return FaultState{profile.kind, severity};
}
