#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class SyslogStyle {
    Cisco,
    Juniper,
    Huawei,
    Arista,
    Generic
};

struct DeviceVendor {
    std::string name;
    std::string enterprise_oid;        // SNMP private enterprise prefix
    std::string gnmi_interface_path;   // subscription path template, {if} is replaced
    std::string os_name;
    std::vector<std::string> models;
    SyslogStyle syslog_style = SyslogStyle::Generic;
};

struct OpticalVendor {
    std::string name;
    std::string serial_prefix;
    std::string part_prefix;
};

class VendorCatalog {
public:
    static const std::vector<DeviceVendor>& device_vendors();
    static const std::vector<OpticalVendor>& optical_vendors();

    // Throws std::out_of_range for vendors not in the catalog
    static const DeviceVendor& device_vendor(const std::string& name);

    static const std::vector<std::string>& speed_classes();
    static int64_t speed_to_bps(const std::string& speed);
    static std::string form_factor(const std::string& speed);
};
