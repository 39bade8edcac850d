#pragma once

#include "ISynthesizer.hpp"
#include <cstdint>
#include <memory>

class SynthesizerFactory {
public:
    // Lifecycle rows come from LifecyclePredictor, not a synthesizer; asking for one
    // throws std::invalid_argument
    static std::unique_ptr<ISynthesizer> create(TableKind kind, uint64_t run_seed, const Topology& topology);
};
