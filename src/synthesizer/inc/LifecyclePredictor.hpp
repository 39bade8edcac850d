#pragma once

#include "DdmHistory.hpp"
#include "Record.hpp"
#include "TableSchema.hpp"
#include "Topology.hpp"

struct LifecycleEstimate {
    size_t window_samples = 0;
    double accumulated_severity = 0.0;
    int64_t fault_events = 0;
    double mean_temperature_c = 0.0;
    double min_rx_power_dbm = 0.0;
    double failure_probability = 0.0;
    int64_t remaining_days = 0;
    FaultKind dominant_fault = FaultKind::None;
};

// Failure estimate of an optical module from its recent DDM window:
//   p = 1 - (1 - p_age) * exp(-0.35 * S)
// where S is the severity accumulated in the window and p_age grows with wear
// from 0.001 toward 0.95. Remaining days run from 1 to the module's life left.
class LifecyclePredictor {
public:
    static constexpr const char* MODEL_NAME = "severity-hazard-v1";
    static constexpr double SEVERITY_WEIGHT = 0.35;
    static constexpr int64_t MAX_REMAINING_DAYS = 3650;
    static constexpr int64_t MIN_LIFE_LEFT_DAYS = 30;

    LifecyclePredictor();

    const TableSchema& schema() const { return schema_; }

    // The history must be non-empty and belong to the key; the row is stamped with
    // the newest observation's timestamp
    Record predict(const InterfaceRef& key, const CommonFieldBlock& common, const DdmHistoryView& history) const;

    static LifecycleEstimate estimate(const OpticalModule& module, const DdmHistoryView& history);
    static double age_probability(const OpticalModule& module);
    static const char* risk_level(double failure_probability);

    static TableSchema make_schema();

private:
    TableSchema schema_;
};
