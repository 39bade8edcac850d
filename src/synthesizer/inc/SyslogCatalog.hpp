#pragma once

#include "FaultInjector.hpp"
#include <string>
#include <vector>

enum class SyslogSeverity {
    Emergency = 0,
    Alert,
    Critical,
    Error,
    Warning,
    Notice,
    Informational,
    Debug
};

struct SyslogTemplate {
    std::string category;     // physical_port, optical_module, l3_protocol, system
    std::string protocol;     // empty unless the event belongs to an L3 protocol
    std::string facility;
    SyslogSeverity severity = SyslogSeverity::Informational;
    std::string process;      // daemon name for Juniper, Arista and generic layouts
    std::string area;         // %AREA-n-MNEMONIC
    std::string mnemonic;
    bool needs_module = false;

    // fmt named arguments: port, speed, host, optic, value, threshold, count, peer, as, area, vni, label
    std::string text;
};

class SyslogCatalog {
public:
    // Templates for a fault kind; FaultKind::None gives the informational set
    static const std::vector<SyslogTemplate>& templates(FaultKind kind);

    static const std::vector<std::string>& facility_names();
    static const std::vector<std::string>& severity_names();

    // Throws std::out_of_range for names not in the list
    static int64_t facility_code(const std::string& facility);
    static const char* severity_name(SyslogSeverity severity);
    static int64_t severity_code(SyslogSeverity severity) { return static_cast<int64_t>(severity); }
};
