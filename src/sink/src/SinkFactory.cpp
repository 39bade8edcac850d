#include "SinkFactory.hpp"
#include "FileRecordSink.hpp"
#include "NullSink.hpp"

std::unique_ptr<IRecordSink> SinkFactory::create_file_sink(const OutputConfig& config, const TableRequest& table) {
    return std::make_unique<FileRecordSink>(config, table.output);
}

std::unique_ptr<IRecordSink> SinkFactory::create_null_sink() {
    return std::make_unique<NullSink>();
}

SinkCreator SinkFactory::file_sinks(const OutputConfig& config) {
    return [config](const TableRequest& table) {
        return create_file_sink(config, table);
    };
}
