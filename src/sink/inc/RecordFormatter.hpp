#pragma once

#include "OutputConfig.hpp"
#include "Record.hpp"
#include "TableSchema.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Text rendering of records. Timestamps are "YYYY-MM-DD HH:MM:SS" UTC in both formats.
class RecordFormatter {
public:
    // RFC 4180: fields with a comma, quote or line break are quoted, quotes doubled
    static std::string csv_escape(const std::string& text);

    static std::string csv_header(const TableSchema& schema);
    static std::string csv_line(const Record& record);

    // Keys in schema column order
    static nlohmann::ordered_json to_json(const TableSchema& schema, const Record& record);

    // Newline terminated lines for the whole batch; CSV batches carry no header
    static std::string format_batch(const TableSchema& schema, const RecordBatch& batch, OutputFormat format);
};
