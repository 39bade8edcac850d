#pragma once

#include <array>
#include <cstdint>
#include <string>

enum class TableKind {
    Grpc,
    Snmp,
    Syslog,
    Ddm,
    Lifecycle
};

inline constexpr std::array<TableKind, 5> ALL_TABLE_KINDS = {
    TableKind::Grpc, TableKind::Snmp, TableKind::Syslog, TableKind::Ddm, TableKind::Lifecycle
};

const char* table_kind_to_string(TableKind kind);

// Throws ConfigurationError(field "tables") for unknown names
TableKind string_to_table_kind(const std::string& str);

std::string default_output_name(TableKind kind);

// Native sampling cadence in seconds
int64_t native_step_seconds(TableKind kind);

// DDM and lifecycle rows exist only for interfaces fitted with an optical module
bool requires_optics(TableKind kind);

inline size_t table_index(TableKind kind) {
    return static_cast<size_t>(kind);
}
