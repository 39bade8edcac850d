#pragma once

#include "Record.hpp"
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <vector>

enum class FieldType {
    Bool,
    Int,
    Double,
    String
};

const char* field_type_to_string(FieldType type);

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
    bool nullable = false;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> allowed;   // empty means any string

    static FieldSpec boolean(const std::string& name);
    static FieldSpec integer(const std::string& name, int64_t min = 0,
                             int64_t max = std::numeric_limits<int64_t>::max(),
                             bool nullable = false);
    static FieldSpec real(const std::string& name, double min, double max, bool nullable = false);
    static FieldSpec text(const std::string& name, bool nullable = false);
    static FieldSpec choice(const std::string& name, std::vector<std::string> allowed);
};

class TableSchema {
public:
    TableSchema(TableKind kind, std::vector<FieldSpec> fields);

    TableKind kind() const { return kind_; }
    std::string name() const { return table_kind_to_string(kind_); }
    const std::vector<FieldSpec>& fields() const { return fields_; }

    // Throws std::out_of_range for unknown names
    size_t index_of(const std::string& field) const;

    // Common block columns followed by the table fields
    std::vector<std::string> column_names() const;

private:
    TableKind kind_;
    std::vector<FieldSpec> fields_;
};
