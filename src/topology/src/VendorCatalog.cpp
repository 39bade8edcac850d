#include "VendorCatalog.hpp"
#include <map>
#include <stdexcept>

const std::vector<DeviceVendor>& VendorCatalog::device_vendors() {
    static const std::vector<DeviceVendor> vendors = {
        {"Cisco", "1.3.6.1.4.1.9",
         "/Cisco-IOS-XR-infra-statsd-oper:infra-statistics/interfaces/interface[interface-name={if}]/latest/generic-counters",
         "IOS-XR 7.5.2", {"NCS-5501", "ASR-9901", "Nexus-9336C"}, SyslogStyle::Cisco},
        {"Huawei", "1.3.6.1.4.1.2011",
         "/huawei-ifm:ifm/interfaces/interface[name={if}]/mib-statistics",
         "VRP V800R021", {"CE6881", "NE40E-X8", "S6730"}, SyslogStyle::Huawei},
        {"Juniper", "1.3.6.1.4.1.2636",
         "/junos/system/linecard/interface/interface[name={if}]",
         "Junos 22.4R1", {"QFX5120", "MX204", "PTX10001"}, SyslogStyle::Juniper},
        {"Arista", "1.3.6.1.4.1.30065",
         "/Sysdb/interface/counter/eth/phy/{if}/counters",
         "EOS 4.30.1F", {"7050CX3", "7280R3", "7800R3"}, SyslogStyle::Arista},
        {"Dell", "1.3.6.1.4.1.674",
         "/openconfig-interfaces:interfaces/interface[name={if}]/state/counters",
         "OS10 10.5.4", {"S5248F", "Z9332F"}, SyslogStyle::Generic},
        {"Broadcom Sonic", "1.3.6.1.4.1.7244",
         "/openconfig-interfaces:interfaces/interface[name={if}]/state/counters",
         "SONiC 4.1 Enterprise", {"AS7726-32X", "AS9716-32D"}, SyslogStyle::Generic},
        {"Community Sonic", "1.3.6.1.4.1.50852",
         "/openconfig-interfaces:interfaces/interface[name={if}]/state/counters",
         "SONiC 202305", {"SN2700", "S6100"}, SyslogStyle::Generic}
    };
    return vendors;
}

const std::vector<OpticalVendor>& VendorCatalog::optical_vendors() {
    static const std::vector<OpticalVendor> vendors = {
        {"Innolight", "INL", "T-"},
        {"Luxshare", "LUX", "LX-"},
        {"Finisar", "FNS", "FTL"},
        {"HGTECH", "HGT", "HG-"},
        {"Eoptolink", "EOL", "EOLQ-"},
        {"Accelink", "ACC", "RTXM"}
    };
    return vendors;
}

const DeviceVendor& VendorCatalog::device_vendor(const std::string& name) {
    for (const auto& v : device_vendors()) {
        if (v.name == name) return v;
    }
    throw std::out_of_range("Unknown device vendor: " + name);
}

const std::vector<std::string>& VendorCatalog::speed_classes() {
    static const std::vector<std::string> speeds = {
        "1G", "10G", "25G", "40G", "100G", "200G", "400G", "800G"
    };
    return speeds;
}

int64_t VendorCatalog::speed_to_bps(const std::string& speed) {
    static const std::map<std::string, int64_t> capacity = {
        {"1G", 1000000000LL},
        {"10G", 10000000000LL},
        {"25G", 25000000000LL},
        {"40G", 40000000000LL},
        {"100G", 100000000000LL},
        {"200G", 200000000000LL},
        {"400G", 400000000000LL},
        {"800G", 800000000000LL}
    };
    auto it = capacity.find(speed);
    if (it == capacity.end()) {
        throw std::out_of_range("Unknown speed class: " + speed);
    }
    return it->second;
}

std::string VendorCatalog::form_factor(const std::string& speed) {
    static const std::map<std::string, std::string> factors = {
        {"1G", "SFP"},
        {"10G", "SFP+"},
        {"25G", "SFP28"},
        {"40G", "QSFP+"},
        {"100G", "QSFP28"},
        {"200G", "QSFP56"},
        {"400G", "QSFP-DD"},
        {"800G", "OSFP"}
    };
    auto it = factors.find(speed);
    return it != factors.end() ? it->second : "SFP";
}
