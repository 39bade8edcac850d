#pragma once

#include "ISynthesizer.hpp"
#include "OpticalModel.hpp"
#include "pcg_random.hpp"
#include <functional>
#include <vector>

// What the lifecycle model needs from one DDM row
struct DdmObservation {
    size_t key_ordinal = 0;
    Timestamp timestamp = 0;
    OpticalReading reading;
    FaultState fault;
};

using DdmObservationBatch = std::vector<DdmObservation>;

// SFF-8472 style digital diagnostics of an optical module
class DdmSynthesizer : public ISynthesizer {
public:
    using Observer = std::function<void(const DdmObservation&)>;

    explicit DdmSynthesizer(uint64_t run_seed);

    TableKind kind() const override { return TableKind::Ddm; }
    const TableSchema& schema() const override { return schema_; }

    // Throws std::invalid_argument for keys without an optical module
    Record synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) override;

    // Called with every produced row, after validation
    void set_observer(Observer observer) { observer_ = std::move(observer); }

    static TableSchema make_schema();

private:
    TableSchema schema_;
    pcg32 rng_;
    Observer observer_;
};
