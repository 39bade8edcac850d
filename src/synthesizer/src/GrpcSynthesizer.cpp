#include "GrpcSynthesizer.hpp"
#include "OpticalModel.hpp"
#include "RandomUtils.hpp"
#include "SchemaValidator.hpp"
#include "TrafficModel.hpp"
#include "VendorCatalog.hpp"
#include <cmath>

namespace {

constexpr int64_t SAMPLE_INTERVAL_SECONDS = 60;

std::string subscription_path(const Device& device, const Interface& iface) {
    std::string path = VendorCatalog::device_vendor(device.vendor).gnmi_interface_path;
    auto pos = path.find("{if}");
    if (pos != std::string::npos) {
        path.replace(pos, 4, iface.name);
    }
    return path;
}

int64_t scaled(int64_t packets, double fraction) {
    return static_cast<int64_t>(std::llround(static_cast<double>(packets) * fraction));
}

}

GrpcSynthesizer::GrpcSynthesizer(uint64_t run_seed, const Topology& topology)
    : schema_(make_schema()),
      rng_(RandomUtils::combine(run_seed, table_index(TableKind::Grpc) + 1), table_index(TableKind::Grpc)),
      states_(topology.interface_count()) {}

TableSchema GrpcSynthesizer::make_schema() {
    std::vector<FieldSpec> fields = {
        FieldSpec::text("subscription_path"),
        FieldSpec::integer("sample_interval_s", 1),
        FieldSpec::choice("admin_status", {"up", "down"}),
        FieldSpec::choice("oper_status", {"up", "down"}),
        FieldSpec::integer("in_octets"),
        FieldSpec::integer("out_octets"),
        FieldSpec::integer("in_pkts"),
        FieldSpec::integer("out_pkts"),
        FieldSpec::integer("in_errors"),
        FieldSpec::integer("out_errors"),
        FieldSpec::integer("in_discards"),
        FieldSpec::integer("out_discards"),
        FieldSpec::real("in_utilization_pct", 0.0, 100.0),
        FieldSpec::real("out_utilization_pct", 0.0, 100.0),
        FieldSpec::real("cpu_utilization_pct", 0.0, 100.0),
        FieldSpec::real("memory_utilization_pct", 0.0, 100.0),
        FieldSpec::integer("mac_table_size"),
        FieldSpec::integer("route_table_size"),
        FieldSpec::real("tcam_utilization_pct", 0.0, 100.0),
        FieldSpec::integer("ecmp_groups", 1),
        FieldSpec::integer("vrf_count", 1),
        FieldSpec::integer("queue_depth_pkts", 0, QUEUE_MAX_DEPTH),
        FieldSpec::integer("congestion_drops"),
        FieldSpec::integer("vni_count", 0, std::numeric_limits<int64_t>::max(), true),
        FieldSpec::integer("vtep_count", 0, std::numeric_limits<int64_t>::max(), true),
        FieldSpec::integer("mpls_tunnels_up", 0, std::numeric_limits<int64_t>::max(), true),
        FieldSpec::real("optical_temperature_c", -40.0, 125.0, true),
        FieldSpec::real("optical_voltage_v", 2.5, 4.0, true),
        FieldSpec::real("optical_bias_ma", 0.0, 150.0, true),
        FieldSpec::real("optical_tx_power_dbm", -40.0, 10.0, true),
        FieldSpec::real("optical_rx_power_dbm", -50.0, 10.0, true)
    };
    AnomalyFields::append_specs(fields);
    return TableSchema(TableKind::Grpc, std::move(fields));
}

Record GrpcSynthesizer::synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) {
    const Device& device = *key.device;
    const Interface& iface = *key.interface;
    const Timestamp ts = common.timestamp;
    KeyState& state = states_.at(key.ordinal);

    CounterSnapshot c = TrafficModel::counters(device, iface, ts);
    int64_t window_pkts = TrafficModel::packets_in_window(device, iface, ts, SAMPLE_INTERVAL_SECONDS);

    bool link_down = fault.kind == FaultKind::LinkFlap && fault.severity >= 0.6;
    double in_util = link_down ? 0.0 : TrafficModel::in_utilization(iface, ts) * 100.0;
    double out_util = link_down ? 0.0 : TrafficModel::out_utilization(iface, ts) * 100.0;

    switch (fault.kind) {
        case FaultKind::HighErrorRate:
            state.extra_in_errors += scaled(window_pkts, 0.02 * fault.severity) + RandomUtils::uniform_int(rng_, 1, 50);
            state.extra_out_errors += scaled(window_pkts, 0.005 * fault.severity);
            state.extra_in_discards += scaled(window_pkts, 0.01 * fault.severity);
            break;
        case FaultKind::LowRxPower:
            state.extra_in_errors += scaled(window_pkts, 0.005 * fault.severity) + RandomUtils::uniform_int(rng_, 1, 10);
            break;
        case FaultKind::LinkFlap:
            state.extra_in_discards += RandomUtils::uniform_int(rng_, 10, 1000);
            state.extra_out_discards += RandomUtils::uniform_int(rng_, 10, 1000);
            break;
        default:
            break;
    }

    // Control plane load follows the traffic curve and rises while a link churns.
    // Baselines leave room for the load, the bounded noise and the churn term below 100.
    double load = TrafficModel::in_utilization(iface, ts);
    double cpu = device.cpu_baseline + 15.0 * load + RandomUtils::truncated_normal(rng_, 0.0, 1.5);
    if (fault.kind == FaultKind::LinkFlap) {
        cpu += 25.0 * fault.severity;
    }
    double memory = RandomUtils::truncated_normal(rng_, device.memory_baseline, 1.0);
    double tcam = RandomUtils::truncated_normal(rng_, device.tcam_utilization, 0.5);
    int64_t mac_size = RandomUtils::jitter_size(rng_, device.mac_table_size, 20, 50);
    int64_t route_size = RandomUtils::jitter_size(rng_, device.route_table_size, 20, 20);

    // Egress queues fill with the square of utilization; congestion faults back them up
    double egress = link_down ? 0.0 : TrafficModel::out_utilization(iface, ts);
    int64_t queue_depth = 0;
    if (!link_down) {
        queue_depth = std::llround(1000.0 * egress * egress) + RandomUtils::uniform_int(rng_, 0, 50);
        if (fault.kind == FaultKind::HighErrorRate || fault.kind == FaultKind::LinkFlap) {
            queue_depth += std::llround(8000.0 * fault.severity);
        }
    }
    state.congestion_drops += egress > 0.6 ? RandomUtils::uniform_int(rng_, 0, 20) : RandomUtils::uniform_int(rng_, 0, 2);
    if (fault.kind == FaultKind::HighErrorRate) {
        state.congestion_drops += scaled(window_pkts, 0.01 * fault.severity) + RandomUtils::uniform_int(rng_, 100, 1000);
    } else if (fault.kind == FaultKind::LinkFlap) {
        state.congestion_drops += RandomUtils::uniform_int(rng_, 100, 1000);
    }

    Record record{TableKind::Grpc, common, {}};
    auto& v = record.values;
    v.reserve(schema_.fields().size());
    v.emplace_back(subscription_path(device, iface));
    v.emplace_back(SAMPLE_INTERVAL_SECONDS);
    v.emplace_back(std::string("up"));
    v.emplace_back(std::string(link_down ? "down" : "up"));
    v.emplace_back(c.in_octets);
    v.emplace_back(c.out_octets);
    v.emplace_back(c.in_pkts);
    v.emplace_back(c.out_pkts);
    v.emplace_back(c.in_errors + state.extra_in_errors);
    v.emplace_back(c.out_errors + state.extra_out_errors);
    v.emplace_back(c.in_discards + state.extra_in_discards);
    v.emplace_back(c.out_discards + state.extra_out_discards);
    v.emplace_back(in_util);
    v.emplace_back(out_util);
    v.emplace_back(cpu);
    v.emplace_back(memory);
    v.emplace_back(mac_size);
    v.emplace_back(route_size);
    v.emplace_back(tcam);
    v.emplace_back(device.route_table_size / 20 + 1);
    v.emplace_back(static_cast<int64_t>(1 + device.vxlan_vnis.size() + device.mpls_labels.size()));
    v.emplace_back(queue_depth);
    v.emplace_back(state.congestion_drops);
    if (device.runs("VXLAN")) {
        v.emplace_back(static_cast<int64_t>(device.vxlan_vnis.size()));
        v.emplace_back(static_cast<int64_t>(device.neighbors.size()));
    } else {
        v.emplace_back(std::monostate{});
        v.emplace_back(std::monostate{});
    }
    if (device.runs("MPLS")) {
        // The LSP riding a downed link is torn down
        int64_t tunnels = static_cast<int64_t>(device.mpls_labels.size());
        v.emplace_back(link_down && tunnels > 0 ? tunnels - 1 : tunnels);
    } else {
        v.emplace_back(std::monostate{});
    }

    if (key.has_module()) {
        OpticalReading r = OpticalModel::sample(*iface.module, fault, rng_);
        v.emplace_back(r.temperature_c);
        v.emplace_back(r.voltage_v);
        v.emplace_back(r.bias_ma);
        v.emplace_back(r.tx_power_dbm);
        v.emplace_back(r.rx_power_dbm);
    } else {
        for (int i = 0; i < 5; ++i) v.emplace_back(std::monostate{});
    }
    AnomalyFields::append_values(v, fault);

    SchemaValidator::validate(schema_, record);
    return record;
}
