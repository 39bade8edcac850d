#pragma once

#include "IRecordSink.hpp"

// Counts and drops everything
class NullSink : public IRecordSink {
public:
    void open(const TableSchema&) override { opened_ = true; }
    void emit(const RecordBatch& batch) override { rows_ += static_cast<int64_t>(batch.size()); }
    void finish(const std::string&) override { finished_ = true; }
    std::string location() const override { return "(discarded)"; }

    int64_t rows() const { return rows_; }
    bool opened() const { return opened_; }
    bool finished() const { return finished_; }

private:
    int64_t rows_ = 0;
    bool opened_ = false;
    bool finished_ = false;
};
