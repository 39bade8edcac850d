#pragma once

#include "Record.hpp"
#include "TableSchema.hpp"
#include <string>

class IRecordSink {
public:
    virtual ~IRecordSink() = default;

    // Called once before the first batch
    virtual void open(const TableSchema& schema) = 0;

    // Batches arrive in generation order; an exception aborts the table
    virtual void emit(const RecordBatch& batch) = 0;

    // Called exactly once at the end, also when nothing was emitted
    virtual void finish(const std::string& table_name) = 0;

    // Where the rows went, for the run summary
    virtual std::string location() const = 0;
};
