#pragma once

#include "GenerationRequest.hpp"
#include "IRecordSink.hpp"
#include "OutputConfig.hpp"
#include <functional>
#include <memory>

// Builds the sink of one table; GenerationEngine takes one so tests can capture rows in memory
using SinkCreator = std::function<std::unique_ptr<IRecordSink>(const TableRequest&)>;

class SinkFactory {
public:
    static std::unique_ptr<IRecordSink> create_file_sink(const OutputConfig& config, const TableRequest& table);
    static std::unique_ptr<IRecordSink> create_null_sink();

    static SinkCreator file_sinks(const OutputConfig& config);
};
