#pragma once

#include "IRecordSink.hpp"
#include <cstdint>
#include <string>

// Groups records into batches for one sink. Every sink exception comes out as a
// SinkWriteError carrying the index of the last batch the sink accepted (-1 if none);
// batches already emitted stay emitted.
class BatchEmitter {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 4096;

    BatchEmitter(IRecordSink& sink, const TableSchema& schema, size_t batch_size = DEFAULT_BATCH_SIZE);

    BatchEmitter(const BatchEmitter&) = delete;
    BatchEmitter& operator=(const BatchEmitter&) = delete;

    void open();

    // Returns true when the call completed a batch and emitted it
    bool add(Record record);

    // Emits the pending partial batch, if any
    bool flush();

    // Flushes and finishes the sink
    void finish();

    // Drops the pending records and finishes the sink without emitting them
    void abandon();

    bool pending_empty() const { return pending_.empty(); }
    size_t pending_size() const { return pending_.size(); }
    int64_t rows_emitted() const { return rows_emitted_; }
    int64_t batches_emitted() const { return last_batch_index_ + 1; }
    int64_t last_batch_index() const { return last_batch_index_; }
    bool finished() const { return finished_; }

private:
    void finish_sink();

    IRecordSink& sink_;
    const TableSchema& schema_;
    std::string table_name_;
    size_t batch_size_;
    RecordBatch pending_;
    int64_t rows_emitted_ = 0;
    int64_t last_batch_index_ = -1;
    bool finished_ = false;
};
