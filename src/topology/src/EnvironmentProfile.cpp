#include "EnvironmentProfile.hpp"
#include "StringUtils.hpp"
#include "TelgenErrors.hpp"
#include <map>

namespace {

const std::vector<EnvironmentProfile>& profiles() {
    static const std::vector<EnvironmentProfile> all = {
        EnvironmentProfile{
            .name = "lab",
            .description = "Small lab bench",
            .default_devices = 4,
            .datacenters = 1,
            .rooms_per_datacenter = 1,
            .racks_per_room = 2,
            .min_ports = 8,
            .max_ports = 16,
            .optics_ratio = 0.9,
            .speeds = {"1G", "10G", "25G", "100G"},
            .network_cidr = "192.168.100.0/24",
            .network_base = 0xC0A86400,
            .host_capacity = 254,
            .role_prefixes = {"lab-sw", "lab-rtr"},
            .primary_vendors = {"Cisco", "Community Sonic"},
            .mac_table_range = {100, 2000},
            .route_table_range = {10, 500},
            .tcam_capacity_range = {4096, 8192},
            .protocols = {"OSPF", "BGP", "LLDP", "STP"}
        },
        EnvironmentProfile{
            .name = "enterprise",
            .description = "Enterprise headquarters network",
            .default_devices = 50,
            .datacenters = 2,
            .rooms_per_datacenter = 2,
            .racks_per_room = 4,
            .min_ports = 8,
            .max_ports = 48,
            .optics_ratio = 0.6,
            .speeds = {"1G", "10G", "25G", "40G"},
            .network_cidr = "192.168.0.0/16",
            .network_base = 0xC0A80000,
            .host_capacity = 65534,
            .role_prefixes = {"core", "dist", "access", "edge"},
            .primary_vendors = {"Cisco", "Huawei", "Juniper"},
            .mac_table_range = {1000, 16000},
            .route_table_range = {500, 20000},
            .tcam_capacity_range = {8192, 32768},
            .protocols = {"OSPF", "STP", "LLDP", "LACP", "VRRP"}
        },
        EnvironmentProfile{
            .name = "campus",
            .description = "University or corporate campus",
            .default_devices = 80,
            .datacenters = 2,
            .rooms_per_datacenter = 3,
            .racks_per_room = 4,
            .min_ports = 24,
            .max_ports = 48,
            .optics_ratio = 0.5,
            .speeds = {"1G", "10G", "25G"},
            .network_cidr = "172.16.0.0/12",
            .network_base = 0xAC100000,
            .host_capacity = 1048574,
            .role_prefixes = {"bb", "dist", "access", "wifi"},
            .primary_vendors = {"Cisco", "Huawei"},
            .mac_table_range = {2000, 32000},
            .route_table_range = {200, 8000},
            .tcam_capacity_range = {8192, 16384},
            .protocols = {"STP", "LLDP", "OSPF", "PIM", "VRRP"}
        },
        EnvironmentProfile{
            .name = "isp",
            .description = "Service provider backbone",
            .default_devices = 60,
            .datacenters = 3,
            .rooms_per_datacenter = 2,
            .racks_per_room = 5,
            .min_ports = 4,
            .max_ports = 32,
            .optics_ratio = 0.8,
            .speeds = {"10G", "100G", "400G", "800G"},
            .network_cidr = "100.64.0.0/10",
            .network_base = 0x64400000,
            .host_capacity = 4194302,
            .role_prefixes = {"edge", "agg", "core", "pe", "p"},
            .primary_vendors = {"Juniper", "Cisco", "Huawei"},
            .mac_table_range = {500, 8000},
            .route_table_range = {200000, 1000000},
            .tcam_capacity_range = {65536, 262144},
            .protocols = {"BGP", "MPLS", "ISIS", "OSPF", "LLDP"}
        },
        EnvironmentProfile{
            .name = "datacenter",
            .description = "Leaf-spine data center fabric",
            .default_devices = 100,
            .datacenters = 3,
            .rooms_per_datacenter = 4,
            .racks_per_room = 5,
            .min_ports = 24,
            .max_ports = 64,
            .optics_ratio = 0.7,
            .speeds = {"10G", "25G", "40G", "100G", "400G"},
            .network_cidr = "10.0.0.0/8",
            .network_base = 0x0A000000,
            .host_capacity = 16777214,
            .role_prefixes = {"spine", "leaf", "border", "core"},
            .primary_vendors = {"Cisco", "Arista", "Juniper"},
            .mac_table_range = {10000, 128000},
            .route_table_range = {10000, 500000},
            .tcam_capacity_range = {32768, 131072},
            .protocols = {"BGP", "VXLAN", "LLDP", "LACP", "OSPF"}
        },
        EnvironmentProfile{
            .name = "complete",
            .description = "Every vendor, speed and protocol",
            .default_devices = 200,
            .datacenters = 3,
            .rooms_per_datacenter = 4,
            .racks_per_room = 5,
            .min_ports = 24,
            .max_ports = 64,
            .optics_ratio = 0.7,
            .speeds = {"1G", "10G", "25G", "40G", "100G", "200G", "400G", "800G"},
            .network_cidr = "10.0.0.0/8",
            .network_base = 0x0A000000,
            .host_capacity = 16777214,
            .role_prefixes = {"spine", "leaf", "border", "core", "edge", "agg", "access"},
            .primary_vendors = {"Cisco", "Huawei", "Juniper", "Arista", "Dell", "Broadcom Sonic", "Community Sonic"},
            .mac_table_range = {1000, 128000},
            .route_table_range = {1000, 1000000},
            .tcam_capacity_range = {8192, 262144},
            .protocols = {"OSPF", "BGP", "VXLAN", "MPLS", "LLDP", "STP", "LACP", "PIM", "ISIS", "VRRP"}
        }
    };
    return all;
}

std::string canonical_name(const std::string& name) {
    static const std::map<std::string, std::string> aliases = {
        {"small-lab", "lab"},
        {"small_lab", "lab"},
        {"large-datacenter", "complete"},
        {"large_datacenter", "complete"},
        {"dc", "datacenter"},
        {"data-center", "datacenter"}
    };

    std::string key = StringUtils::to_lower(name);
    StringUtils::trim(key);
    auto it = aliases.find(key);
    return it != aliases.end() ? it->second : key;
}

const EnvironmentProfile* find_profile(const std::string& name) {
    std::string key = canonical_name(name);
    for (const auto& p : profiles()) {
        if (p.name == key) return &p;
    }
    return nullptr;
}

}

const EnvironmentProfile& EnvironmentProfile::get(const std::string& name) {
    if (const auto* p = find_profile(name)) {
        return *p;
    }
    throw ConfigurationError("environment",
        "unknown profile '" + name + "', expected one of: " + StringUtils::join(names(), ", "));
}

bool EnvironmentProfile::exists(const std::string& name) {
    return find_profile(name) != nullptr;
}

std::vector<std::string> EnvironmentProfile::names() {
    std::vector<std::string> result;
    for (const auto& p : profiles()) {
        result.push_back(p.name);
    }
    return result;
}
