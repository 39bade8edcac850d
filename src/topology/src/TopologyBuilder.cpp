#include "TopologyBuilder.hpp"
#include "GenerationRequest.hpp"
#include "IdentityGenerator.hpp"
#include "LogUtils.hpp"
#include "RandomUtils.hpp"
#include "TelgenErrors.hpp"
#include "VendorCatalog.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace {

constexpr uint64_t TOPOLOGY_STREAM = 0x746F706FULL;

struct Placement {
    std::string datacenter;
    std::string room;
    std::string rack;
};

Placement place(const EnvironmentProfile& profile, size_t index) {
    size_t racks_per_dc = profile.rooms_per_datacenter * profile.racks_per_room;
    size_t slot = index % (profile.datacenters * racks_per_dc);
    size_t dc = slot / racks_per_dc;
    size_t room = (slot % racks_per_dc) / profile.racks_per_room;
    size_t rack = slot % profile.racks_per_room;
    return Placement{
        fmt::format("DC{}", dc + 1),
        fmt::format("Pod{:02d}", room + 1),
        fmt::format("Rack{:02d}", rack + 1)
    };
}

std::vector<double> vendor_weights(const EnvironmentProfile& profile) {
    const auto& vendors = VendorCatalog::device_vendors();
    size_t primary = 0;
    for (const auto& v : vendors) {
        if (std::find(profile.primary_vendors.begin(), profile.primary_vendors.end(), v.name) != profile.primary_vendors.end()) {
            ++primary;
        }
    }
    size_t secondary = vendors.size() - primary;

    std::vector<double> weights;
    for (const auto& v : vendors) {
        bool is_primary = std::find(profile.primary_vendors.begin(), profile.primary_vendors.end(), v.name) != profile.primary_vendors.end();
        if (is_primary) {
            weights.push_back(secondary == 0 ? 1.0 / primary : 0.7 / primary);
        } else {
            weights.push_back(primary == 0 ? 1.0 / secondary : 0.3 / secondary);
        }
    }
    return weights;
}

OpticalModule make_module(pcg32& rng, const std::string& speed) {
    const auto& vendor = RandomUtils::pick(rng, VendorCatalog::optical_vendors());
    std::string form_factor = VendorCatalog::form_factor(speed);

    OpticalModule module;
    module.vendor = vendor.name;
    module.serial = fmt::format("{}{:02d}{:08X}", vendor.serial_prefix, 18 + rng(7), rng());
    module.part_number = fmt::format("{}{}-{}", vendor.part_prefix, form_factor, speed);
    module.form_factor = form_factor;
    module.age_days = RandomUtils::uniform_int(rng, 30, 2500);
    module.design_life_days = RandomUtils::uniform_int(rng, 1825, 3650);
    module.temperature_c = RandomUtils::uniform(rng, 30.0, 55.0);
    module.voltage_v = RandomUtils::uniform(rng, 3.25, 3.35);
    module.bias_ma = RandomUtils::uniform(rng, 20.0, 60.0);
    module.tx_power_dbm = RandomUtils::uniform(rng, -2.0, 1.5);
    module.rx_power_dbm = RandomUtils::uniform(rng, -4.0, 0.0);
    return module;
}

TrafficBaseline make_baseline(pcg32& rng) {
    // Peak out utilization is at most 0.5 * 1.4 * 1.3, inside line rate
    TrafficBaseline baseline;
    baseline.utilization = RandomUtils::uniform(rng, 0.08, 0.5);
    baseline.amplitude = baseline.utilization * RandomUtils::uniform(rng, 0.1, 0.4);
    baseline.phase_hours = RandomUtils::uniform(rng, 0.0, 24.0);
    baseline.out_in_ratio = RandomUtils::uniform(rng, 0.7, 1.3);
    baseline.avg_packet_bytes = RandomUtils::uniform(rng, 300.0, 1200.0);
    baseline.error_rate = RandomUtils::uniform(rng, 1e-10, 1e-8);
    baseline.discard_rate = RandomUtils::uniform(rng, 1e-9, 1e-7);
    return baseline;
}

std::vector<std::string> choose_protocols(pcg32& rng, const EnvironmentProfile& profile) {
    std::vector<std::string> protocols;
    for (const auto& p : profile.protocols) {
        if (p == "LLDP" || RandomUtils::chance(rng, 0.8)) {
            protocols.push_back(p);
        }
    }
    if (protocols.empty()) {
        protocols.push_back(profile.protocols.front());
    }
    return protocols;
}

}

std::string TopologyBuilder::format_ipv4(uint32_t address) {
    return fmt::format("{}.{}.{}.{}", (address >> 24) & 0xFF, (address >> 16) & 0xFF,
                       (address >> 8) & 0xFF, address & 0xFF);
}

TopologyPtr TopologyBuilder::build(const std::string& environment, std::optional<int64_t> device_count,
                                   uint64_t seed, Timestamp reference_time) {
    const EnvironmentProfile& profile = EnvironmentProfile::get(environment);
    return build(profile, device_count.value_or(profile.default_devices), seed, reference_time);
}

TopologyPtr TopologyBuilder::build(const EnvironmentProfile& profile, int64_t device_count,
                                   uint64_t seed, Timestamp reference_time) {
    if (device_count <= 0) {
        throw ConfigurationError("device_count", "must be positive, got " + std::to_string(device_count));
    }
    if (device_count > GenerationRequest::MAX_DEVICE_COUNT) {
        throw ConfigurationError("device_count",
            "must not exceed " + std::to_string(GenerationRequest::MAX_DEVICE_COUNT) +
            ", got " + std::to_string(device_count));
    }
    if (static_cast<uint64_t>(device_count) > profile.host_capacity) {
        throw ConfigurationError("device_count",
            fmt::format("{} devices do not fit the {} management network {}",
                        device_count, profile.name, profile.network_cidr));
    }

    pcg32 rng(seed, TOPOLOGY_STREAM);
    const auto& vendors = VendorCatalog::device_vendors();
    const auto weights = vendor_weights(profile);
    const size_t count = static_cast<size_t>(device_count);

    std::vector<std::string> hostnames;
    hostnames.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& role = profile.role_prefixes[i % profile.role_prefixes.size()];
        hostnames.push_back(fmt::format("{}-{:03d}", role, i + 1));
    }

    std::vector<Device> devices;
    devices.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Device device;
        const DeviceVendor& vendor = vendors[RandomUtils::weighted_index(rng, weights)];
        size_t model_index = rng(static_cast<uint32_t>(vendor.models.size()));
        Placement placement = place(profile, i);

        device.hostname = hostnames[i];
        device.role = profile.role_prefixes[i % profile.role_prefixes.size()];
        device.ip = format_ipv4(profile.network_base + static_cast<uint32_t>(i) + 1);
        device.vendor = vendor.name;
        device.model = vendor.models[model_index];
        device.datacenter = placement.datacenter;
        device.room = placement.room;
        device.rack = placement.rack;
        device.sys_object_id = fmt::format("{}.1.{}", vendor.enterprise_oid, 1000 + model_index);
        device.sys_descr = fmt::format("{} {} running {}", vendor.name, device.model, vendor.os_name);
        device.boot_time = reference_time - RandomUtils::uniform_int(rng, TimestampUtils::SECONDS_PER_DAY,
                                                                    90 * TimestampUtils::SECONDS_PER_DAY);
        device.cpu_baseline = RandomUtils::uniform(rng, 5.0, 40.0);
        device.memory_baseline = RandomUtils::uniform(rng, 20.0, 70.0);

        device.mac_table_capacity = profile.mac_table_range.second;
        device.mac_table_size = RandomUtils::uniform_int(rng, profile.mac_table_range.first, profile.mac_table_range.second);
        device.route_table_size = RandomUtils::uniform_int(rng, profile.route_table_range.first, profile.route_table_range.second);
        device.tcam_capacity = RandomUtils::uniform_int(rng, profile.tcam_capacity_range.first, profile.tcam_capacity_range.second);
        device.tcam_utilization = RandomUtils::uniform(rng, 10.0, 70.0);

        device.protocols = choose_protocols(rng, profile);
        device.bgp_as = 64512 + RandomUtils::uniform_int(rng, 0, 1000);
        device.ospf_area = fmt::format("0.0.0.{}", (i % profile.datacenters));
        if (device.runs("VXLAN")) {
            for (int v = 0; v < 3; ++v) {
                device.vxlan_vnis.push_back(10000 + RandomUtils::uniform_int(rng, 0, 9999));
            }
        }
        if (device.runs("MPLS")) {
            for (int l = 0; l < 3; ++l) {
                device.mpls_labels.push_back(RandomUtils::uniform_int(rng, 16, 1048575));
            }
        }
        for (size_t k = 1; k <= 3; ++k) {
            if (count > 1) {
                device.neighbors.push_back(format_ipv4(profile.network_base + static_cast<uint32_t>((i + k) % count) + 1));
            } else {
                device.neighbors.push_back(fmt::format("192.0.2.{}", k));
            }
        }

        size_t ports = static_cast<size_t>(RandomUtils::uniform_int(rng,
            static_cast<int64_t>(profile.min_ports), static_cast<int64_t>(profile.max_ports)));
        for (size_t p = 0; p < ports; ++p) {
            Interface iface;
            iface.name = fmt::format("Ethernet{}/{}", p / 32 + 1, p % 32 + 1);
            iface.if_index = static_cast<int64_t>(p) + 1;
            iface.alias = fmt::format("link to {}", hostnames[(i + p + 1) % count]);
            iface.mtu = std::vector<int64_t>{1500, 9000, 9216}[RandomUtils::weighted_index(rng, {0.5, 0.3, 0.2})];
            iface.speed = RandomUtils::pick(rng, profile.speeds);
            iface.speed_bps = VendorCatalog::speed_to_bps(iface.speed);
            iface.last_change = device.boot_time + RandomUtils::uniform_int(rng, 30, 3600);
            iface.baseline = make_baseline(rng);

            double optics = iface.speed == "1G" ? profile.optics_ratio / 2.0 : profile.optics_ratio;
            if (RandomUtils::chance(rng, optics)) {
                iface.module = make_module(rng, iface.speed);
            }
            device.interfaces.push_back(std::move(iface));
        }
        devices.push_back(std::move(device));
    }

    // Optical tables need at least one module to report on
    bool any_module = std::any_of(devices.begin(), devices.end(), [](const Device& d) {
        return std::any_of(d.interfaces.begin(), d.interfaces.end(),
                           [](const Interface& it) { return it.module.has_value(); });
    });
    if (!any_module) {
        Interface& first = devices.front().interfaces.front();
        first.module = make_module(rng, first.speed);
    }

    for (auto& device : devices) {
        for (auto& iface : device.interfaces) {
            iface.module_id = IdentityGenerator::module_id(device, iface);
        }
    }

    auto topology = std::make_shared<Topology>(profile.name, std::move(devices));
    LogUtils::info("Built {} topology: {} devices, {} interfaces, {} optical modules",
                   profile.name, topology->device_count(), topology->interface_count(), topology->module_count());
    return topology;
}
