#pragma once

#include "TableSchema.hpp"

class SchemaValidator {
public:
    // Logs and throws SchemaViolationError on the first value outside its domain.
    // Values are never clamped here.
    static void validate(const TableSchema& schema, const Record& record);
};
