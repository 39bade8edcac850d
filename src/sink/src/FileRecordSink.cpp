#include "FileRecordSink.hpp"
#include "LogUtils.hpp"
#include "RecordFormatter.hpp"
#include <filesystem>
#include <stdexcept>

FileRecordSink::FileRecordSink(const OutputConfig& config, const std::string& output_name)
    : config_(config),
      path_(file_path(config, output_name)),
      compressor_(Compressor::create(config.compression)) {}

FileRecordSink::~FileRecordSink() {
    if (out_.is_open()) {
        out_.close();
    }
}

std::string FileRecordSink::file_path(const OutputConfig& config, const std::string& output_name) {
    std::filesystem::path path = std::filesystem::path(config.directory) /
        (output_name + output_format_extension(config.format) + compression_suffix(config.compression));
    return path.string();
}

void FileRecordSink::open(const TableSchema& schema) {
    if (out_.is_open()) {
        throw std::logic_error("Sink " + path_ + " is already open");
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + config_.directory + ": " + ec.message());
    }

    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw std::runtime_error("Cannot open " + path_ + " for writing");
    }
    schema_ = &schema;

    if (config_.format == OutputFormat::Csv) {
        write_frame(RecordFormatter::csv_header(schema) + "\n");
    }
    LogUtils::debug("Opened {} ({}, compression {})", path_, output_format_to_string(config_.format),
                    compression_to_string(config_.compression));
}

void FileRecordSink::emit(const RecordBatch& batch) {
    if (!out_.is_open() || !schema_) {
        throw std::logic_error("Sink " + path_ + " is not open");
    }
    if (batch.empty()) return;

    write_frame(RecordFormatter::format_batch(*schema_, batch, config_.format));
    rows_written_ += static_cast<int64_t>(batch.size());
}

void FileRecordSink::finish(const std::string& table_name) {
    if (!out_.is_open()) {
        return;
    }
    out_.flush();
    bool ok = static_cast<bool>(out_);
    out_.close();
    if (!ok || out_.fail()) {
        throw std::runtime_error("Failed to finish " + path_ + " for table " + table_name);
    }
    LogUtils::debug("Closed {}: {} rows, {} bytes", path_, rows_written_, bytes_written_);
}

void FileRecordSink::write_frame(const std::string& text) {
    std::string frame = compressor_->compress_frame(text);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    if (!out_) {
        throw std::runtime_error("Write to " + path_ + " failed");
    }
    bytes_written_ += static_cast<int64_t>(frame.size());
}
