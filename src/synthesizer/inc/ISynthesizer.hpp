#pragma once

#include "FaultInjector.hpp"
#include "Record.hpp"
#include "TableSchema.hpp"
#include "Topology.hpp"
#include <vector>

class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    virtual TableKind kind() const = 0;
    virtual const TableSchema& schema() const = 0;

    // Produces one validated row for the key at common.timestamp. Calls for the same key
    // must come in timestamp order since per-key counters accumulate.
    virtual Record synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) = 0;
};

namespace AnomalyFields {

// anomaly, anomaly_type and optionally severity, appended after the table fields
void append_specs(std::vector<FieldSpec>& fields, bool with_severity = true);
void append_values(std::vector<FieldValue>& values, const FaultState& fault, bool with_severity = true);

}
