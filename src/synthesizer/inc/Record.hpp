#pragma once

#include "IdentityGenerator.hpp"
#include "TableKind.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// monostate is a SQL-style null
using FieldValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

struct Record {
    TableKind table = TableKind::Grpc;
    CommonFieldBlock common;
    std::vector<FieldValue> values;   // same order as TableSchema::fields()
};

using RecordBatch = std::vector<Record>;

std::string field_value_to_string(const FieldValue& value);
