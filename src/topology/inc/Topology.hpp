#pragma once

#include "TimestampUtils.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct OpticalModule {
    std::string vendor;
    std::string serial;
    std::string part_number;
    std::string form_factor;
    int64_t age_days = 0;
    int64_t design_life_days = 0;

    // Nominal operating point the DDM readings scatter around
    double temperature_c = 0.0;
    double voltage_v = 0.0;
    double bias_ma = 0.0;
    double tx_power_dbm = 0.0;
    double rx_power_dbm = 0.0;
};

// Parameters of the diurnal utilization curve u(t) = utilization + amplitude * sin(2*pi*(t - phase)/day)
struct TrafficBaseline {
    double utilization = 0.0;
    double amplitude = 0.0;
    double phase_hours = 0.0;
    double out_in_ratio = 1.0;
    double avg_packet_bytes = 800.0;
    double error_rate = 0.0;       // errors per packet at baseline
    double discard_rate = 0.0;
};

struct Interface {
    std::string name;
    int64_t if_index = 0;
    std::string alias;
    int64_t mtu = 1500;
    std::string speed;
    int64_t speed_bps = 0;
    Timestamp last_change = 0;
    TrafficBaseline baseline;
    std::optional<OpticalModule> module;
    std::string module_id;
};

struct Device {
    std::string hostname;
    std::string ip;
    std::string vendor;
    std::string model;
    std::string role;
    std::string datacenter;
    std::string room;
    std::string rack;

    std::string sys_object_id;
    std::string sys_descr;
    Timestamp boot_time = 0;
    double cpu_baseline = 0.0;
    double memory_baseline = 0.0;

    int64_t mac_table_capacity = 0;
    int64_t mac_table_size = 0;
    int64_t route_table_size = 0;
    int64_t tcam_capacity = 0;
    double tcam_utilization = 0.0;

    int64_t bgp_as = 0;
    std::string ospf_area;
    std::vector<int64_t> vxlan_vnis;
    std::vector<int64_t> mpls_labels;
    std::vector<std::string> protocols;
    std::vector<std::string> neighbors;   // peer addresses used in protocol messages

    std::vector<Interface> interfaces;

    bool runs(const std::string& protocol) const;
};

// A (device, interface) pair; ordinal is the position in Topology::interface_keys()
struct InterfaceRef {
    const Device* device = nullptr;
    const Interface* interface = nullptr;
    size_t ordinal = 0;

    bool has_module() const { return interface && interface->module.has_value(); }
};

// Immutable once built; shared read-only by all generation workers
class Topology {
public:
    Topology(std::string environment, std::vector<Device> devices);

    Topology(const Topology&) = delete;
    Topology& operator=(const Topology&) = delete;

    const std::string& environment() const { return environment_; }
    const std::vector<Device>& devices() const { return devices_; }

    // Every interface, device-major in build order
    const std::vector<InterfaceRef>& interface_keys() const { return interface_keys_; }

    // Interfaces fitted with an optical module, same order
    const std::vector<InterfaceRef>& optical_keys() const { return optical_keys_; }

    size_t device_count() const { return devices_.size(); }
    size_t interface_count() const { return interface_keys_.size(); }
    size_t module_count() const { return optical_keys_.size(); }

    bool contains_module_id(const std::string& module_id) const;
    const InterfaceRef* find(const std::string& module_id) const;

    // In interface_keys() order
    std::vector<std::string> module_ids() const;

private:
    std::string environment_;
    std::vector<Device> devices_;
    std::vector<InterfaceRef> interface_keys_;
    std::vector<InterfaceRef> optical_keys_;
    std::unordered_map<std::string, size_t> by_module_id_;
};

using TopologyPtr = std::shared_ptr<const Topology>;
