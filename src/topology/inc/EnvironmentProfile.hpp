#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct EnvironmentProfile {
    std::string name;
    std::string description;
    int64_t default_devices = 0;

    // Placement
    size_t datacenters = 1;
    size_t rooms_per_datacenter = 1;
    size_t racks_per_room = 1;

    // Interfaces per device and optics
    size_t min_ports = 8;
    size_t max_ports = 48;
    double optics_ratio = 0.5;
    std::vector<std::string> speeds;

    // Management network, host addresses are handed out from base + 1
    std::string network_cidr;
    uint32_t network_base = 0;
    uint32_t host_capacity = 0;

    std::vector<std::string> role_prefixes;
    std::vector<std::string> primary_vendors;

    std::pair<int64_t, int64_t> mac_table_range;
    std::pair<int64_t, int64_t> route_table_range;
    std::pair<int64_t, int64_t> tcam_capacity_range;

    // L3 features the syslog templates may mention
    std::vector<std::string> protocols;

    // Case-insensitive, accepts aliases; throws ConfigurationError(field "environment")
    static const EnvironmentProfile& get(const std::string& name);
    static bool exists(const std::string& name);
    static std::vector<std::string> names();
};
