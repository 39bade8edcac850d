#include "SnmpSynthesizer.hpp"
#include "RandomUtils.hpp"
#include "SchemaValidator.hpp"
#include "TrafficModel.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr int64_t POLL_INTERVAL_SECONDS = 300;

int64_t scaled(int64_t packets, double fraction) {
    return static_cast<int64_t>(std::llround(static_cast<double>(packets) * fraction));
}

}

SnmpSynthesizer::SnmpSynthesizer(uint64_t run_seed, const Topology& topology)
    : schema_(make_schema()),
      rng_(RandomUtils::combine(run_seed, table_index(TableKind::Snmp) + 1), table_index(TableKind::Snmp)),
      states_(topology.interface_count()) {}

TableSchema SnmpSynthesizer::make_schema() {
    std::vector<FieldSpec> fields = {
        FieldSpec::integer("ifIndex", 1),
        FieldSpec::text("ifDescr"),
        FieldSpec::text("ifAlias"),
        FieldSpec::integer("ifType", 1, 300),
        FieldSpec::integer("ifMtu", 64, 65535),
        FieldSpec::integer("ifSpeed", 0, GAUGE32_MAX),
        FieldSpec::choice("ifAdminStatus", {"up", "down", "testing"}),
        FieldSpec::choice("ifOperStatus", {"up", "down", "testing", "unknown", "dormant", "notPresent", "lowerLayerDown"}),
        FieldSpec::integer("ifLastChange"),
        FieldSpec::integer("ifHCInOctets"),
        FieldSpec::integer("ifHCOutOctets"),
        FieldSpec::integer("ifInUcastPkts"),
        FieldSpec::integer("ifOutUcastPkts"),
        FieldSpec::integer("ifInErrors"),
        FieldSpec::integer("ifOutErrors"),
        FieldSpec::integer("ifInDiscards"),
        FieldSpec::integer("ifOutDiscards"),
        FieldSpec::integer("ifInBroadcastPkts"),
        FieldSpec::integer("ifOutBroadcastPkts"),
        FieldSpec::integer("ifInMulticastPkts"),
        FieldSpec::integer("ifOutMulticastPkts"),
        FieldSpec::integer("stormControlDrops"),
        FieldSpec::integer("macTableSize"),
        FieldSpec::text("sysObjectID"),
        FieldSpec::integer("sysUpTime"),
        FieldSpec::real("cpu5min", 0.0, 100.0)
    };
    AnomalyFields::append_specs(fields);
    return TableSchema(TableKind::Snmp, std::move(fields));
}

Record SnmpSynthesizer::synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) {
    const Device& device = *key.device;
    const Interface& iface = *key.interface;
    const Timestamp ts = common.timestamp;
    KeyState& state = states_.at(key.ordinal);

    CounterSnapshot c = TrafficModel::counters(device, iface, ts);
    int64_t window_pkts = TrafficModel::packets_in_window(device, iface, ts, POLL_INTERVAL_SECONDS);
    int64_t uptime = TrafficModel::uptime_ticks(device, ts);

    bool link_down = false;
    switch (fault.kind) {
        case FaultKind::LinkFlap: {
            link_down = true;
            // The flap happened somewhere in the last poll interval
            int64_t back = RandomUtils::uniform_int(rng_, 0, POLL_INTERVAL_SECONDS * 100);
            state.last_change_ticks = uptime - back;
            state.extra_in_discards += RandomUtils::uniform_int(rng_, 10, 1000);
            break;
        }
        case FaultKind::HighErrorRate:
            state.extra_in_errors += scaled(window_pkts, 0.02 * fault.severity) + RandomUtils::uniform_int(rng_, 1, 50);
            state.extra_out_errors += scaled(window_pkts, 0.005 * fault.severity);
            // Error storms come with broadcast floods
            state.extra_in_broadcast += scaled(window_pkts, 0.05 * fault.severity);
            state.storm_drops += scaled(window_pkts, 0.01 * fault.severity) + RandomUtils::uniform_int(rng_, 1, 100);
            break;
        case FaultKind::LowRxPower:
            state.extra_in_errors += scaled(window_pkts, 0.005 * fault.severity) + RandomUtils::uniform_int(rng_, 1, 10);
            break;
        default:
            break;
    }

    // Devices boot at least a day before the range, so every change time lies inside sysUpTime
    int64_t last_change = state.last_change_ticks;
    if (last_change < 0) {
        last_change = (iface.last_change - device.boot_time) * 100;
    }

    double cpu = device.cpu_baseline + 15.0 * TrafficModel::in_utilization(iface, ts) + RandomUtils::truncated_normal(rng_, 0.0, 1.0);
    if (fault.kind == FaultKind::LinkFlap || fault.kind == FaultKind::HighErrorRate) {
        cpu += 20.0 * fault.severity;
    }

    Record record{TableKind::Snmp, common, {}};
    auto& v = record.values;
    v.reserve(schema_.fields().size());
    v.emplace_back(iface.if_index);
    v.emplace_back(iface.name);
    v.emplace_back(iface.alias);
    v.emplace_back(IF_TYPE_ETHERNET);
    v.emplace_back(iface.mtu);
    // ifSpeed saturates for links faster than a Gauge32 can hold (RFC 2863)
    v.emplace_back(std::min(iface.speed_bps, GAUGE32_MAX));
    v.emplace_back(std::string("up"));
    v.emplace_back(std::string(link_down ? "down" : "up"));
    v.emplace_back(last_change);
    v.emplace_back(c.in_octets);
    v.emplace_back(c.out_octets);
    v.emplace_back(c.in_unicast_pkts);
    v.emplace_back(c.out_unicast_pkts);
    v.emplace_back(c.in_errors + state.extra_in_errors);
    v.emplace_back(c.out_errors + state.extra_out_errors);
    v.emplace_back(c.in_discards + state.extra_in_discards);
    v.emplace_back(c.out_discards);
    v.emplace_back(c.in_broadcast_pkts + state.extra_in_broadcast);
    v.emplace_back(c.out_broadcast_pkts);
    v.emplace_back(c.in_multicast_pkts);
    v.emplace_back(c.out_multicast_pkts);
    v.emplace_back(state.storm_drops);
    v.emplace_back(RandomUtils::jitter_size(rng_, device.mac_table_size, 20, 50));
    v.emplace_back(device.sys_object_id);
    v.emplace_back(uptime);
    v.emplace_back(cpu);
    AnomalyFields::append_values(v, fault);

    SchemaValidator::validate(schema_, record);
    return record;
}
