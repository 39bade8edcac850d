#pragma once

#include "ISynthesizer.hpp"
#include "pcg_random.hpp"
#include <cstdint>
#include <vector>

// IF-MIB interface counters plus a few system scalars
class SnmpSynthesizer : public ISynthesizer {
public:
    SnmpSynthesizer(uint64_t run_seed, const Topology& topology);

    TableKind kind() const override { return TableKind::Snmp; }
    const TableSchema& schema() const override { return schema_; }

    Record synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) override;

    static TableSchema make_schema();

    // ifType ethernetCsmacd
    static constexpr int64_t IF_TYPE_ETHERNET = 6;
    static constexpr int64_t GAUGE32_MAX = 4294967295LL;

private:
    struct KeyState {
        int64_t extra_in_errors = 0;
        int64_t extra_out_errors = 0;
        int64_t extra_in_discards = 0;
        int64_t extra_in_broadcast = 0;
        int64_t storm_drops = 0;
        int64_t last_change_ticks = -1;   // set by the most recent link flap
    };

    TableSchema schema_;
    pcg32 rng_;
    std::vector<KeyState> states_;
};
