#pragma once

#include "GlobalConfig.hpp"
#include "GenerationRequest.hpp"
#include "OutputConfig.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    GenerationRequest request;
    OutputConfig output;
};
