#pragma once

#include "Topology.hpp"
#include <cstdint>

struct CounterSnapshot {
    int64_t in_octets = 0;
    int64_t out_octets = 0;
    int64_t in_pkts = 0;
    int64_t out_pkts = 0;
    int64_t in_broadcast_pkts = 0;
    int64_t out_broadcast_pkts = 0;
    int64_t in_multicast_pkts = 0;
    int64_t out_multicast_pkts = 0;
    int64_t in_unicast_pkts = 0;
    int64_t out_unicast_pkts = 0;
    int64_t in_errors = 0;
    int64_t out_errors = 0;
    int64_t in_discards = 0;
    int64_t out_discards = 0;
};

// Closed-form traffic of an interface: counters are the integral of a diurnal
// utilization curve since device boot, so any table sampling the same key at the
// same instant reports the same values.
class TrafficModel {
public:
    // Utilization in [0, 1]
    // Fraction of line rate. Baselines keep amplitude below utilization and
    // utilization * (1 + amplitude ratio) * out_in_ratio below 1.
    static double in_utilization(const Interface& iface, Timestamp ts);
    static double out_utilization(const Interface& iface, Timestamp ts);

    // Baseline counters (no fault contribution), 64-bit wrapping
    static CounterSnapshot counters(const Device& device, const Interface& iface, Timestamp ts);

    // Packets seen by the interface during the window before ts
    static int64_t packets_in_window(const Device& device, const Interface& iface, Timestamp ts, int64_t window);

    static int64_t uptime_ticks(const Device& device, Timestamp ts);

private:
    // Integral of utilization from boot to ts, in seconds at line rate
    static double busy_seconds(const Device& device, const Interface& iface, Timestamp ts);
};
