#pragma once

#include "EnvironmentProfile.hpp"
#include "Topology.hpp"
#include <optional>

class TopologyBuilder {
public:
    // Deterministic for a given (profile, device_count, seed, reference_time).
    // reference_time anchors device boot times; counters are measured from boot.
    // Throws ConfigurationError for a device count outside (0, 5000] or beyond the profile network.
    static TopologyPtr build(const EnvironmentProfile& profile, int64_t device_count,
                             uint64_t seed, Timestamp reference_time);

    // device_count defaults to the profile's size
    static TopologyPtr build(const std::string& environment, std::optional<int64_t> device_count,
                             uint64_t seed, Timestamp reference_time);

    static std::string format_ipv4(uint32_t address);
};
