#include "SyslogSynthesizer.hpp"
#include "OpticalModel.hpp"
#include "RandomUtils.hpp"
#include "SchemaValidator.hpp"
#include "StringUtils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace {

bool runs_protocol(const Device& device, const std::string& protocol) {
    return std::find(device.protocols.begin(), device.protocols.end(), protocol) != device.protocols.end();
}

}

SyslogSynthesizer::SyslogSynthesizer(uint64_t run_seed, const Topology& topology)
    : schema_(make_schema()),
      rng_(RandomUtils::combine(run_seed, table_index(TableKind::Syslog) + 1), table_index(TableKind::Syslog)),
      sequences_(topology.interface_count(), 0) {}

TableSchema SyslogSynthesizer::make_schema() {
    std::vector<FieldSpec> fields = {
        FieldSpec::choice("facility", SyslogCatalog::facility_names()),
        FieldSpec::integer("facility_code", 0, 23),
        FieldSpec::choice("severity_name", SyslogCatalog::severity_names()),
        FieldSpec::integer("severity_code", 0, 7),
        FieldSpec::choice("event_category", {"physical_port", "optical_module", "l3_protocol", "system"}),
        FieldSpec::text("protocol", true),
        FieldSpec::text("message"),
        FieldSpec::text("raw_log")
    };
    AnomalyFields::append_specs(fields, false);
    return TableSchema(TableKind::Syslog, std::move(fields));
}

const SyslogTemplate& SyslogSynthesizer::choose_template(const InterfaceRef& key, FaultKind kind) {
    eligible_.clear();
    for (const auto& tpl : SyslogCatalog::templates(kind)) {
        if (tpl.needs_module && !key.has_module()) continue;
        if (!tpl.protocol.empty() && !runs_protocol(*key.device, tpl.protocol)) continue;
        eligible_.push_back(&tpl);
    }
    if (eligible_.empty()) {
        throw std::logic_error(fmt::format("No syslog template for fault kind {}", fault_kind_to_string(kind)));
    }
    return *RandomUtils::pick(rng_, eligible_);
}

std::string SyslogSynthesizer::render_message(const SyslogTemplate& tpl, const InterfaceRef& key, const FaultState& fault) {
    const Device& device = *key.device;
    const Interface& iface = *key.interface;

    double value = 0.0;
    double threshold = 0.0;
    std::string optic = "none";
    if (key.has_module()) {
        const OpticalModule& module = *iface.module;
        optic = fmt::format("{} {}", module.vendor, module.part_number);
        OpticalReading reading = OpticalModel::sample(module, fault, rng_);
        switch (fault.kind) {
            case FaultKind::HighTemperature:
                value = reading.temperature_c;
                threshold = OpticalThresholds::TEMPERATURE_HIGH_C;
                break;
            case FaultKind::VoltageDrift:
                value = reading.voltage_v;
                threshold = reading.voltage_v < OpticalThresholds::VOLTAGE_LOW_V
                    ? OpticalThresholds::VOLTAGE_LOW_V : OpticalThresholds::VOLTAGE_HIGH_V;
                break;
            default:
                value = reading.rx_power_dbm;
                threshold = OpticalThresholds::RX_POWER_LOW_DBM;
                break;
        }
    }

    int64_t count = fault.anomalous()
        ? RandomUtils::uniform_int(rng_, 10, 10 + static_cast<int64_t>(5000 * fault.severity))
        : RandomUtils::uniform_int(rng_, 1, 500);
    std::string peer = device.neighbors.empty() ? std::string("192.0.2.1") : RandomUtils::pick(rng_, device.neighbors);
    int64_t vni = device.vxlan_vnis.empty() ? 10000 : RandomUtils::pick(rng_, device.vxlan_vnis);
    int64_t label = device.mpls_labels.empty() ? 16 : RandomUtils::pick(rng_, device.mpls_labels);

    return fmt::format(fmt::runtime(tpl.text),
                       fmt::arg("port", iface.name),
                       fmt::arg("speed", iface.speed),
                       fmt::arg("host", device.hostname),
                       fmt::arg("optic", optic),
                       fmt::arg("value", value),
                       fmt::arg("threshold", threshold),
                       fmt::arg("count", count),
                       fmt::arg("peer", peer),
                       fmt::arg("as", device.bgp_as),
                       fmt::arg("area", device.ospf_area),
                       fmt::arg("vni", vni),
                       fmt::arg("label", label));
}

std::string SyslogSynthesizer::format_raw_log(SyslogStyle style, const RawLogParts& parts) {
    const SyslogTemplate& tpl = *parts.tpl;
    std::string stamp = TimestampUtils::format_syslog(parts.timestamp);
    int64_t code = SyslogCatalog::severity_code(tpl.severity);

    switch (style) {
        case SyslogStyle::Cisco:
            return fmt::format("{} {} {}: {}: %{}-{}-{}: {}", stamp, parts.ip, parts.sequence,
                               parts.hostname, tpl.area, code, tpl.mnemonic, parts.message);
        case SyslogStyle::Juniper:
            return fmt::format("{} {} {}[{}]: {}_{}: {}", stamp, parts.hostname, tpl.process, parts.pid,
                               tpl.area, tpl.mnemonic, parts.message);
        case SyslogStyle::Huawei:
            return fmt::format("{} {} %%01{}/{}/{}(l): {}", stamp, parts.hostname, tpl.area, code,
                               tpl.mnemonic, parts.message);
        case SyslogStyle::Arista:
            return fmt::format("{} {} {}: %{}-{}-{}: {}", stamp, parts.hostname, tpl.process, tpl.area, code,
                               tpl.mnemonic, parts.message);
        case SyslogStyle::Generic:
        default: {
            int64_t pri = SyslogCatalog::facility_code(tpl.facility) * 8 + code;
            return fmt::format("<{}>{} {} {}[{}]: {}", pri, stamp, parts.hostname, tpl.process, parts.pid,
                               parts.message);
        }
    }
}

Record SyslogSynthesizer::synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) {
    const Device& device = *key.device;
    const SyslogTemplate& tpl = choose_template(key, fault.kind);

    RawLogParts parts;
    parts.timestamp = common.timestamp;
    parts.hostname = device.hostname;
    parts.ip = device.ip;
    parts.sequence = ++sequences_.at(key.ordinal);
    parts.pid = RandomUtils::uniform_int(rng_, 1000, 9999);
    parts.tpl = &tpl;
    parts.message = render_message(tpl, key, fault);

    SyslogStyle style = VendorCatalog::device_vendor(device.vendor).syslog_style;

    Record record{TableKind::Syslog, common, {}};
    auto& v = record.values;
    v.reserve(schema_.fields().size());
    v.emplace_back(tpl.facility);
    v.emplace_back(SyslogCatalog::facility_code(tpl.facility));
    v.emplace_back(std::string(SyslogCatalog::severity_name(tpl.severity)));
    v.emplace_back(SyslogCatalog::severity_code(tpl.severity));
    v.emplace_back(tpl.category);
    if (tpl.protocol.empty()) {
        v.emplace_back(std::monostate{});
    } else {
        v.emplace_back(tpl.protocol);
    }
    v.emplace_back(parts.message);
    v.emplace_back(format_raw_log(style, parts));
    AnomalyFields::append_values(v, fault, false);

    SchemaValidator::validate(schema_, record);
    return record;
}
