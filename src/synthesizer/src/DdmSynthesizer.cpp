#include "DdmSynthesizer.hpp"
#include "RandomUtils.hpp"
#include "SchemaValidator.hpp"
#include <stdexcept>

DdmSynthesizer::DdmSynthesizer(uint64_t run_seed)
    : schema_(make_schema()),
      rng_(RandomUtils::combine(run_seed, table_index(TableKind::Ddm) + 1), table_index(TableKind::Ddm)) {}

TableSchema DdmSynthesizer::make_schema() {
    std::vector<FieldSpec> fields = {
        FieldSpec::text("module_vendor"),
        FieldSpec::text("module_serial"),
        FieldSpec::text("module_part"),
        FieldSpec::real("temperature_c", -40.0, 125.0),
        FieldSpec::real("voltage_v", 2.5, 4.0),
        FieldSpec::real("bias_current_ma", 0.0, 150.0),
        FieldSpec::real("tx_power_dbm", -40.0, 10.0),
        FieldSpec::real("rx_power_dbm", -50.0, 10.0),
        FieldSpec::real("tx_power_mw", 0.0, 10.0),
        FieldSpec::real("rx_power_mw", 0.0, 10.0),
        FieldSpec::text("alarm_flags")
    };
    AnomalyFields::append_specs(fields);
    return TableSchema(TableKind::Ddm, std::move(fields));
}

Record DdmSynthesizer::synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) {
    if (!key.has_module()) {
        throw std::invalid_argument("DDM sample requested for " + common.module_id + " which has no optical module");
    }
    const OpticalModule& module = *key.interface->module;
    OpticalReading reading = OpticalModel::sample(module, fault, rng_);

    Record record{TableKind::Ddm, common, {}};
    auto& v = record.values;
    v.reserve(schema_.fields().size());
    v.emplace_back(module.vendor);
    v.emplace_back(module.serial);
    v.emplace_back(module.part_number);
    v.emplace_back(reading.temperature_c);
    v.emplace_back(reading.voltage_v);
    v.emplace_back(reading.bias_ma);
    v.emplace_back(reading.tx_power_dbm);
    v.emplace_back(reading.rx_power_dbm);
    v.emplace_back(OpticalModel::dbm_to_mw(reading.tx_power_dbm));
    v.emplace_back(OpticalModel::dbm_to_mw(reading.rx_power_dbm));
    v.emplace_back(OpticalModel::alarm_flags(reading));
    AnomalyFields::append_values(v, fault);

    SchemaValidator::validate(schema_, record);

    if (observer_) {
        observer_(DdmObservation{key.ordinal, common.timestamp, reading, fault});
    }
    return record;
}
