#include "BatchEmitter.hpp"
#include "LogUtils.hpp"
#include "TelgenErrors.hpp"
#include <stdexcept>

BatchEmitter::BatchEmitter(IRecordSink& sink, const TableSchema& schema, size_t batch_size)
    : sink_(sink), schema_(schema), table_name_(schema.name()), batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw std::invalid_argument("Batch size must be positive");
    }
    pending_.reserve(batch_size_);
}

void BatchEmitter::open() {
    try {
        sink_.open(schema_);
    } catch (const std::exception& e) {
        throw SinkWriteError(table_name_, last_batch_index_, e.what());
    }
}

bool BatchEmitter::add(Record record) {
    if (finished_) {
        throw std::logic_error("BatchEmitter for " + table_name_ + " is already finished");
    }
    pending_.push_back(std::move(record));
    if (pending_.size() >= batch_size_) {
        return flush();
    }
    return false;
}

bool BatchEmitter::flush() {
    if (pending_.empty()) {
        return false;
    }

    try {
        sink_.emit(pending_);
    } catch (const std::exception& e) {
        LogUtils::error("Sink for {} failed after batch {}: {}", table_name_, last_batch_index_, e.what());
        throw SinkWriteError(table_name_, last_batch_index_, e.what());
    }

    ++last_batch_index_;
    rows_emitted_ += static_cast<int64_t>(pending_.size());
    pending_.clear();
    return true;
}

void BatchEmitter::finish() {
    if (finished_) return;
    flush();
    finish_sink();
}

void BatchEmitter::abandon() {
    if (finished_) return;
    if (!pending_.empty()) {
        LogUtils::debug("Dropping {} pending {} records", pending_.size(), table_name_);
        pending_.clear();
    }
    finish_sink();
}

void BatchEmitter::finish_sink() {
    finished_ = true;
    try {
        sink_.finish(table_name_);
    } catch (const std::exception& e) {
        throw SinkWriteError(table_name_, last_batch_index_, e.what());
    }
}
