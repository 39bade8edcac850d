#pragma once

#include "Topology.hpp"
#include <string>
#include <vector>

// Columns every table row starts with
struct CommonFieldBlock {
    Timestamp timestamp = 0;
    std::string module_id;
    std::string datacenter;
    std::string room;
    std::string rack;
    std::string device_hostname;
    std::string device_ip;
    std::string device_vendor;
    std::string interface;
    std::string speed;

    static const std::vector<std::string>& column_names();
};

class IdentityGenerator {
public:
    // <vendor>-<datacenter>-<room>-<rack>-<hostname>-<interface>-<speed>, where vendor is the
    // optical module vendor if one is fitted and the device vendor otherwise
    static std::string module_id(const Device& device, const Interface& iface);

    // Throws std::logic_error for a ref that does not point into a topology
    static CommonFieldBlock common_fields_for(const InterfaceRef& key, Timestamp timestamp);
};
