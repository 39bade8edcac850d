#pragma once

#include "ISynthesizer.hpp"
#include "pcg_random.hpp"
#include <cstdint>
#include <vector>

// gNMI interface, platform and transceiver telemetry
class GrpcSynthesizer : public ISynthesizer {
public:
    GrpcSynthesizer(uint64_t run_seed, const Topology& topology);

    TableKind kind() const override { return TableKind::Grpc; }
    const TableSchema& schema() const override { return schema_; }

    Record synthesize(const InterfaceRef& key, const CommonFieldBlock& common, const FaultState& fault) override;

    static TableSchema make_schema();

    static constexpr int64_t QUEUE_MAX_DEPTH = 10000;

private:
    struct KeyState {
        int64_t extra_in_errors = 0;
        int64_t extra_out_errors = 0;
        int64_t extra_in_discards = 0;
        int64_t extra_out_discards = 0;
        int64_t congestion_drops = 0;
    };

    TableSchema schema_;
    pcg32 rng_;
    std::vector<KeyState> states_;
};
