#include "TrafficModel.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr double TWO_PI = 6.283185307179586;
constexpr double DAY = 86400.0;
constexpr double COUNTER_WRAP = 9223372036854775807.0;

double phase_angle(const Interface& iface, double t) {
    return TWO_PI * (t - iface.baseline.phase_hours * 3600.0) / DAY;
}

int64_t wrap(double value) {
    if (value <= 0.0) return 0;
    return static_cast<int64_t>(std::fmod(value, COUNTER_WRAP));
}

}

double TrafficModel::in_utilization(const Interface& iface, Timestamp ts) {
    const auto& b = iface.baseline;
    return b.utilization + b.amplitude * std::sin(phase_angle(iface, static_cast<double>(ts)));
}

double TrafficModel::out_utilization(const Interface& iface, Timestamp ts) {
    return in_utilization(iface, ts) * iface.baseline.out_in_ratio;
}

double TrafficModel::busy_seconds(const Device& device, const Interface& iface, Timestamp ts) {
    const auto& b = iface.baseline;
    double t0 = static_cast<double>(device.boot_time);
    double t1 = static_cast<double>(std::max(ts, device.boot_time));
    // Integral of u + a*sin(w(t - p)) dt from t0 to t1
    double k = DAY / TWO_PI;
    double periodic = b.amplitude * k * (std::cos(phase_angle(iface, t0)) - std::cos(phase_angle(iface, t1)));
    return b.utilization * (t1 - t0) + periodic;
}

CounterSnapshot TrafficModel::counters(const Device& device, const Interface& iface, Timestamp ts) {
    const auto& b = iface.baseline;
    double bytes_per_second = static_cast<double>(iface.speed_bps) / 8.0;
    double in_bytes = busy_seconds(device, iface, ts) * bytes_per_second;
    double out_bytes = in_bytes * b.out_in_ratio;
    double in_pkts = in_bytes / b.avg_packet_bytes;
    double out_pkts = out_bytes / b.avg_packet_bytes;

    CounterSnapshot c;
    c.in_octets = wrap(in_bytes);
    c.out_octets = wrap(out_bytes);
    c.in_pkts = wrap(in_pkts);
    c.out_pkts = wrap(out_pkts);
    c.in_broadcast_pkts = wrap(in_pkts * 0.01);
    c.out_broadcast_pkts = wrap(out_pkts * 0.005);
    c.in_multicast_pkts = wrap(in_pkts * 0.02);
    c.out_multicast_pkts = wrap(out_pkts * 0.015);
    c.in_unicast_pkts = wrap(in_pkts * 0.97);
    c.out_unicast_pkts = wrap(out_pkts * 0.98);
    c.in_errors = wrap(in_pkts * b.error_rate);
    c.out_errors = wrap(out_pkts * b.error_rate * 0.5);
    c.in_discards = wrap(in_pkts * b.discard_rate);
    c.out_discards = wrap(out_pkts * b.discard_rate);
    return c;
}

int64_t TrafficModel::packets_in_window(const Device& device, const Interface& iface, Timestamp ts, int64_t window) {
    double bytes_per_second = static_cast<double>(iface.speed_bps) / 8.0;
    double busy = busy_seconds(device, iface, ts) - busy_seconds(device, iface, ts - window);
    return wrap(busy * bytes_per_second / iface.baseline.avg_packet_bytes);
}

int64_t TrafficModel::uptime_ticks(const Device& device, Timestamp ts) {
    return std::max<int64_t>(0, ts - device.boot_time) * 100;
}
