#pragma once

#include "Compressor.hpp"
#include "IRecordSink.hpp"
#include "OutputConfig.hpp"
#include <fstream>
#include <memory>
#include <string>

// CSV or JSON Lines file under the output directory. With compression every batch
// is written as an independent frame, so a partially written file still decodes
// up to the last complete batch.
class FileRecordSink : public IRecordSink {
public:
    FileRecordSink(const OutputConfig& config, const std::string& output_name);
    ~FileRecordSink() override;

    void open(const TableSchema& schema) override;
    void emit(const RecordBatch& batch) override;
    void finish(const std::string& table_name) override;
    std::string location() const override { return path_; }

    int64_t rows_written() const { return rows_written_; }
    int64_t bytes_written() const { return bytes_written_; }

    // <directory>/<output_name>.<csv|jsonl>[.gz|.lz4|.zst]
    static std::string file_path(const OutputConfig& config, const std::string& output_name);

private:
    void write_frame(const std::string& text);

    OutputConfig config_;
    std::string path_;
    std::unique_ptr<BaseCompressor> compressor_;
    std::ofstream out_;
    const TableSchema* schema_ = nullptr;
    int64_t rows_written_ = 0;
    int64_t bytes_written_ = 0;
};
