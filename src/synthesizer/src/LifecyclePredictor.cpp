#include "LifecyclePredictor.hpp"
#include "SchemaValidator.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

LifecyclePredictor::LifecyclePredictor() : schema_(make_schema()) {}

TableSchema LifecyclePredictor::make_schema() {
    return TableSchema(TableKind::Lifecycle, {
        FieldSpec::text("module_vendor"),
        FieldSpec::text("module_serial"),
        FieldSpec::choice("model_name", {MODEL_NAME}),
        FieldSpec::integer("window_samples", 1, static_cast<int64_t>(DdmHistory::DEFAULT_WINDOW)),
        FieldSpec::real("accumulated_severity", 0.0, static_cast<double>(DdmHistory::DEFAULT_WINDOW)),
        FieldSpec::integer("fault_events", 0, static_cast<int64_t>(DdmHistory::DEFAULT_WINDOW)),
        FieldSpec::real("mean_temperature_c", -40.0, 125.0),
        FieldSpec::real("min_rx_power_dbm", -50.0, 10.0),
        FieldSpec::integer("module_age_days", 0),
        FieldSpec::real("failure_probability", 0.0, 1.0),
        FieldSpec::integer("predicted_remaining_days", 1, MAX_REMAINING_DAYS),
        FieldSpec::text("predicted_failure_date"),
        FieldSpec::choice("risk_level", {"low", "medium", "high", "critical"}),
        FieldSpec::choice("dominant_fault", fault_kind_names())
    });
}

double LifecyclePredictor::age_probability(const OpticalModule& module) {
    double wear = static_cast<double>(module.age_days) / static_cast<double>(std::max<int64_t>(module.design_life_days, 1));
    return 0.001 + 0.949 * (1.0 - std::exp(-0.25 * wear * wear * wear));
}

const char* LifecyclePredictor::risk_level(double failure_probability) {
    if (failure_probability < 0.25) return "low";
    if (failure_probability < 0.5) return "medium";
    if (failure_probability < 0.75) return "high";
    return "critical";
}

LifecycleEstimate LifecyclePredictor::estimate(const OpticalModule& module, const DdmHistoryView& history) {
    if (history.empty()) {
        throw std::invalid_argument("Lifecycle estimate needs at least one DDM observation");
    }

    LifecycleEstimate e;
    e.window_samples = history.size();
    e.min_rx_power_dbm = history[0].reading.rx_power_dbm;

    std::array<double, 6> severity_by_kind{};
    double temperature_sum = 0.0;
    for (size_t i = 0; i < history.size(); ++i) {
        const DdmObservation& obs = history[i];
        temperature_sum += obs.reading.temperature_c;
        e.min_rx_power_dbm = std::min(e.min_rx_power_dbm, obs.reading.rx_power_dbm);
        if (obs.fault.anomalous()) {
            ++e.fault_events;
            e.accumulated_severity += obs.fault.severity;
            severity_by_kind[static_cast<size_t>(obs.fault.kind)] += obs.fault.severity;
        }
    }
    e.mean_temperature_c = temperature_sum / static_cast<double>(history.size());

    for (size_t k = 1; k < severity_by_kind.size(); ++k) {
        if (severity_by_kind[k] > 0.0 &&
            (e.dominant_fault == FaultKind::None || severity_by_kind[k] > severity_by_kind[static_cast<size_t>(e.dominant_fault)])) {
            e.dominant_fault = static_cast<FaultKind>(k);
        }
    }

    double p_age = age_probability(module);
    e.failure_probability = 1.0 - (1.0 - p_age) * std::exp(-SEVERITY_WEIGHT * e.accumulated_severity);

    // Modules past design life are still given a month; p < 1 keeps at least a day
    int64_t life_left = std::max<int64_t>(module.design_life_days - module.age_days, MIN_LIFE_LEFT_DAYS);
    e.remaining_days = 1 + std::llround(static_cast<double>(life_left - 1) * (1.0 - e.failure_probability));
    return e;
}

Record LifecyclePredictor::predict(const InterfaceRef& key, const CommonFieldBlock& common, const DdmHistoryView& history) const {
    if (!key.has_module()) {
        throw std::invalid_argument("Lifecycle prediction requested for " + common.module_id + " which has no optical module");
    }
    const OpticalModule& module = *key.interface->module;
    LifecycleEstimate e = estimate(module, history);

    Timestamp failure_at = common.timestamp + e.remaining_days * TimestampUtils::SECONDS_PER_DAY;

    Record record{TableKind::Lifecycle, common, {}};
    auto& v = record.values;
    v.reserve(schema_.fields().size());
    v.emplace_back(module.vendor);
    v.emplace_back(module.serial);
    v.emplace_back(std::string(MODEL_NAME));
    v.emplace_back(static_cast<int64_t>(e.window_samples));
    v.emplace_back(e.accumulated_severity);
    v.emplace_back(e.fault_events);
    v.emplace_back(e.mean_temperature_c);
    v.emplace_back(e.min_rx_power_dbm);
    v.emplace_back(module.age_days);
    v.emplace_back(e.failure_probability);
    v.emplace_back(e.remaining_days);
    v.emplace_back(TimestampUtils::format_date(failure_at));
    v.emplace_back(std::string(risk_level(e.failure_probability)));
    v.emplace_back(std::string(fault_kind_to_string(e.dominant_fault)));

    SchemaValidator::validate(schema_, record);
    return record;
}
