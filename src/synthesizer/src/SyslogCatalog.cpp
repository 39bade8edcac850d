#include "SyslogCatalog.hpp"
#include <stdexcept>

namespace {

using S = SyslogSeverity;

const std::vector<SyslogTemplate> NORMAL_TEMPLATES = {
    {"physical_port", "", "local7", S::Notice, "ifmgr", "LINK", "UPDOWN",
     false, "Interface {port}, changed state to up"},
    {"physical_port", "", "local7", S::Informational, "ifmgr", "ETHPORT", "SPEED",
     false, "Interface {port}, operational speed changed to {speed}"},
    {"physical_port", "", "local7", S::Informational, "ifmgr", "ETHPORT", "DUPLEX",
     false, "Interface {port}, operational duplex mode changed to Full"},
    {"physical_port", "", "local7", S::Notice, "lldpd", "LLDP", "NBR_ADD",
     false, "LLDP neighbor discovered on {port}, chassis {peer}"},
    {"physical_port", "", "local7", S::Informational, "lacpd", "LACP", "BUNDLE_UP",
     false, "Port {port} added to port-channel, bundle up"},
    {"optical_module", "", "local7", S::Informational, "xcvrd", "TRANSCEIVER", "INSERTED",
     true, "Transceiver {optic} inserted in {port}"},
    {"optical_module", "", "local7", S::Informational, "xcvrd", "TRANSCEIVER", "DDM_OK",
     true, "Transceiver on {port} DDM values within thresholds, rx {value:.2f} dBm"},
    {"l3_protocol", "BGP", "local7", S::Notice, "rpd", "BGP", "ADJCHANGE",
     false, "BGP neighbor {peer} (AS {as}) Up"},
    {"l3_protocol", "BGP", "local7", S::Informational, "rpd", "BGP", "UPDATE",
     false, "BGP update received from {peer} (AS {as}), {count} prefixes"},
    {"l3_protocol", "OSPF", "local7", S::Notice, "rpd", "OSPF", "ADJCHG",
     false, "OSPF neighbor {peer} on {port} from LOADING to FULL, area {area}"},
    {"l3_protocol", "OSPF", "local7", S::Informational, "rpd", "OSPF", "SPF",
     false, "OSPF SPF calculation completed for area {area} in {count} ms"},
    {"l3_protocol", "VXLAN", "local7", S::Notice, "vxlan", "VXLAN", "TUNNEL_UP",
     false, "VXLAN tunnel to VTEP {peer} established, VNI {vni}"},
    {"l3_protocol", "VXLAN", "local7", S::Informational, "vxlan", "VXLAN", "MAC_LEARN",
     false, "VNI {vni}: learned {count} MAC addresses from VTEP {peer}"},
    {"l3_protocol", "MPLS", "local7", S::Notice, "ldpd", "LDP", "SESSION_UP",
     false, "LDP session with {peer} up"},
    {"l3_protocol", "MPLS", "local7", S::Informational, "rsvpd", "MPLS", "LSP_UP",
     false, "LSP to {peer} up, label {label}"},
    {"l3_protocol", "ISIS", "local7", S::Notice, "isisd", "ISIS", "ADJCHANGE",
     false, "IS-IS adjacency to {peer} on {port} Up"},
    {"l3_protocol", "STP", "local7", S::Notice, "stpd", "SPANTREE", "TOPOCHANGE",
     false, "Topology change detected on {port}"},
    {"l3_protocol", "VRRP", "local7", S::Notice, "vrrpd", "VRRP", "STATECHANGE",
     false, "VRRP group on {port} state Backup -> Master"},
    {"l3_protocol", "LLDP", "local7", S::Informational, "lldpd", "LLDP", "NBR_UPDATE",
     false, "LLDP neighbor information changed on {port}"},
    {"l3_protocol", "PIM", "local7", S::Notice, "pimd", "PIM", "NBRCHG",
     false, "PIM neighbor {peer} on {port} up"},
    {"l3_protocol", "LACP", "local7", S::Informational, "lacpd", "LACP", "PARTNER",
     false, "LACP partner on {port} in sync"}
};

const std::vector<SyslogTemplate> LINK_FLAP_TEMPLATES = {
    {"physical_port", "", "local7", S::Error, "ifmgr", "LINK", "UPDOWN",
     false, "Interface {port}, changed state to down"},
    {"physical_port", "", "local7", S::Warning, "ifmgr", "ETHPORT", "FLAP",
     false, "Port flapping detected on {port}, {count} transitions in 60s"},
    {"l3_protocol", "BGP", "local7", S::Error, "rpd", "BGP", "ADJCHANGE",
     false, "BGP neighbor {peer} (AS {as}) Down, hold timer expired"},
    {"l3_protocol", "OSPF", "local7", S::Error, "rpd", "OSPF", "ADJCHG",
     false, "OSPF neighbor {peer} on {port} from FULL to DOWN, area {area}"},
    {"l3_protocol", "ISIS", "local7", S::Error, "isisd", "ISIS", "ADJCHANGE",
     false, "IS-IS adjacency to {peer} on {port} Down, interface down"},
    {"l3_protocol", "VXLAN", "local7", S::Warning, "vxlan", "VXLAN", "TUNNEL_DOWN",
     false, "VXLAN tunnel to VTEP {peer} down, VNI {vni}"}
};

const std::vector<SyslogTemplate> HIGH_TEMPERATURE_TEMPLATES = {
    {"optical_module", "", "local7", S::Warning, "xcvrd", "TRANSCEIVER", "TEMP_HIGH",
     true, "Transceiver on {port} ({optic}) temperature high, value {value:.1f}C, threshold {threshold:.1f}C"},
    {"optical_module", "", "local7", S::Error, "xcvrd", "TRANSCEIVER", "TEMP_ALARM",
     true, "Transceiver on {port} temperature alarm, {value:.1f}C exceeds {threshold:.1f}C"},
    {"system", "", "daemon", S::Warning, "envmon", "ENVMON", "TEMP_WARN",
     false, "Temperature sensor near {port} above threshold"}
};

const std::vector<SyslogTemplate> HIGH_ERROR_RATE_TEMPLATES = {
    {"physical_port", "", "local7", S::Warning, "ifmgr", "ETHPORT", "CRC_ERR",
     false, "CRC errors detected on {port}, count {count}"},
    {"physical_port", "", "local7", S::Error, "ifmgr", "ETHPORT", "INPUT_ERR",
     false, "Input errors on {port} exceeded threshold, {count} in last interval"},
    {"physical_port", "", "local7", S::Warning, "ifmgr", "STORM", "CONTROL",
     false, "Storm control triggered on {port}, {count} packets dropped"}
};

const std::vector<SyslogTemplate> LOW_RX_POWER_TEMPLATES = {
    {"optical_module", "", "local7", S::Warning, "xcvrd", "TRANSCEIVER", "RX_LOW",
     true, "Rx power low on {port} ({optic}), value {value:.2f} dBm, threshold {threshold:.2f} dBm"},
    {"optical_module", "", "local7", S::Error, "xcvrd", "TRANSCEIVER", "RX_ALARM",
     true, "Transceiver on {port} receive power alarm, {value:.2f} dBm below {threshold:.2f} dBm"},
    {"physical_port", "", "local7", S::Warning, "ifmgr", "ETHPORT", "SIGNAL_DEGRADE",
     false, "Signal degrade on {port}, receive level below threshold"}
};

const std::vector<SyslogTemplate> VOLTAGE_DRIFT_TEMPLATES = {
    {"optical_module", "", "local7", S::Warning, "xcvrd", "TRANSCEIVER", "VCC_WARN",
     true, "Transceiver on {port} supply voltage out of range, value {value:.3f} V"},
    {"system", "", "daemon", S::Warning, "envmon", "ENVMON", "PWR_WARN",
     false, "Power supply voltage fluctuation detected on the line card of {port}"}
};

const std::vector<std::string> FACILITY_NAMES = {
    "kern", "user", "mail", "daemon", "auth", "syslog", "lpr", "news",
    "uucp", "cron", "authpriv", "ftp", "ntp", "security", "console", "solaris-cron",
    "local0", "local1", "local2", "local3", "local4", "local5", "local6", "local7"
};

const std::vector<std::string> SEVERITY_NAMES = {
    "emerg", "alert", "crit", "err", "warning", "notice", "info", "debug"
};

}

const std::vector<SyslogTemplate>& SyslogCatalog::templates(FaultKind kind) {
    switch (kind) {
        case FaultKind::LinkFlap:        return LINK_FLAP_TEMPLATES;
        case FaultKind::HighTemperature: return HIGH_TEMPERATURE_TEMPLATES;
        case FaultKind::HighErrorRate:   return HIGH_ERROR_RATE_TEMPLATES;
        case FaultKind::LowRxPower:      return LOW_RX_POWER_TEMPLATES;
        case FaultKind::VoltageDrift:    return VOLTAGE_DRIFT_TEMPLATES;
        case FaultKind::None:
        default:
            return NORMAL_TEMPLATES;
    }
}

const std::vector<std::string>& SyslogCatalog::facility_names() {
    return FACILITY_NAMES;
}

const std::vector<std::string>& SyslogCatalog::severity_names() {
    return SEVERITY_NAMES;
}

int64_t SyslogCatalog::facility_code(const std::string& facility) {
    for (size_t i = 0; i < FACILITY_NAMES.size(); ++i) {
        if (FACILITY_NAMES[i] == facility) return static_cast<int64_t>(i);
    }
    throw std::out_of_range("Unknown syslog facility: " + facility);
}

const char* SyslogCatalog::severity_name(SyslogSeverity severity) {
    return SEVERITY_NAMES.at(static_cast<size_t>(severity)).c_str();
}
