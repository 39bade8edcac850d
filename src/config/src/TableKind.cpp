#include "TableKind.hpp"
#include "StringUtils.hpp"
#include "TelgenErrors.hpp"

const char* table_kind_to_string(TableKind kind) {
    switch (kind) {
        case TableKind::Grpc:      return "grpc";
        case TableKind::Snmp:      return "snmp";
        case TableKind::Syslog:    return "syslog";
        case TableKind::Ddm:       return "ddm";
        case TableKind::Lifecycle: return "lifecycle";
        default: return "unknown";
    }
}

TableKind string_to_table_kind(const std::string& str) {
    std::string s = StringUtils::to_lower(str);
    StringUtils::trim(s);
    if (s == "grpc" || s == "gnmi") return TableKind::Grpc;
    if (s == "snmp")                return TableKind::Snmp;
    if (s == "syslog")              return TableKind::Syslog;
    if (s == "ddm")                 return TableKind::Ddm;
    if (s == "lifecycle" || s == "predict" || s == "prediction") return TableKind::Lifecycle;
    throw ConfigurationError("tables", "unknown table '" + str + "'");
}

std::string default_output_name(TableKind kind) {
    switch (kind) {
        case TableKind::Grpc:      return "grpc_data";
        case TableKind::Snmp:      return "snmp_data";
        case TableKind::Syslog:    return "syslog_data";
        case TableKind::Ddm:       return "ddm_data";
        case TableKind::Lifecycle: return "predict_data";
        default: return "unknown_data";
    }
}

int64_t native_step_seconds(TableKind kind) {
    switch (kind) {
        case TableKind::Grpc:      return 60;
        case TableKind::Snmp:      return 300;
        case TableKind::Syslog:    return 1;
        case TableKind::Ddm:       return 300;
        case TableKind::Lifecycle: return 300;
        default: return 60;
    }
}

bool requires_optics(TableKind kind) {
    return kind == TableKind::Ddm || kind == TableKind::Lifecycle;
}
