#include "TableSchema.hpp"
#include <fmt/format.h>
#include <stdexcept>

std::string field_value_to_string(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

const char* field_type_to_string(FieldType type) {
    switch (type) {
        case FieldType::Bool:   return "bool";
        case FieldType::Int:    return "int";
        case FieldType::Double: return "double";
        case FieldType::String: return "string";
        default: return "unknown";
    }
}

FieldSpec FieldSpec::boolean(const std::string& name) {
    return FieldSpec{name, FieldType::Bool, false, std::nullopt, std::nullopt, {}};
}

FieldSpec FieldSpec::integer(const std::string& name, int64_t min, int64_t max, bool nullable) {
    return FieldSpec{name, FieldType::Int, nullable, static_cast<double>(min), static_cast<double>(max), {}};
}

FieldSpec FieldSpec::real(const std::string& name, double min, double max, bool nullable) {
    return FieldSpec{name, FieldType::Double, nullable, min, max, {}};
}

FieldSpec FieldSpec::text(const std::string& name, bool nullable) {
    return FieldSpec{name, FieldType::String, nullable, std::nullopt, std::nullopt, {}};
}

FieldSpec FieldSpec::choice(const std::string& name, std::vector<std::string> allowed) {
    return FieldSpec{name, FieldType::String, false, std::nullopt, std::nullopt, std::move(allowed)};
}

TableSchema::TableSchema(TableKind kind, std::vector<FieldSpec> fields)
    : kind_(kind), fields_(std::move(fields)) {}

size_t TableSchema::index_of(const std::string& field) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == field) return i;
    }
    throw std::out_of_range("Table " + name() + " has no field " + field);
}

std::vector<std::string> TableSchema::column_names() const {
    std::vector<std::string> names = CommonFieldBlock::column_names();
    for (const auto& f : fields_) {
        names.push_back(f.name);
    }
    return names;
}
