#include "ISynthesizer.hpp"

namespace AnomalyFields {

void append_specs(std::vector<FieldSpec>& fields, bool with_severity) {
    fields.push_back(FieldSpec::boolean("anomaly"));
    fields.push_back(FieldSpec::choice("anomaly_type", fault_kind_names()));
    if (with_severity) {
        fields.push_back(FieldSpec::real("severity", 0.0, 1.0));
    }
}

void append_values(std::vector<FieldValue>& values, const FaultState& fault, bool with_severity) {
    values.emplace_back(fault.anomalous());
    values.emplace_back(std::string(fault_kind_to_string(fault.kind)));
    if (with_severity) {
        values.emplace_back(fault.anomalous() ? fault.severity : 0.0);
    }
}

}
