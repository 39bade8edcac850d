#include "SchemaValidator.hpp"
#include "LogUtils.hpp"
#include "TelgenErrors.hpp"
#include <algorithm>
#include <cmath>

namespace {

[[noreturn]] void violation(const TableSchema& schema, const std::string& field,
                            const FieldValue& value, const std::string& reason) {
    std::string text = field_value_to_string(value);
    LogUtils::error("Schema violation in {} field {}: value {} ({})", schema.name(), field, text, reason);
    throw SchemaViolationError(schema.name(), field, text, reason);
}

void check_range(const TableSchema& schema, const FieldSpec& spec, const FieldValue& value, double number) {
    if (spec.min && number < *spec.min) {
        violation(schema, spec.name, value, "below minimum " + field_value_to_string(FieldValue(*spec.min)));
    }
    if (spec.max && number > *spec.max) {
        violation(schema, spec.name, value, "above maximum " + field_value_to_string(FieldValue(*spec.max)));
    }
}

}

void SchemaValidator::validate(const TableSchema& schema, const Record& record) {
    if (record.table != schema.kind()) {
        violation(schema, "table", FieldValue(std::string(table_kind_to_string(record.table))),
                  "record belongs to another table");
    }

    const auto& fields = schema.fields();
    if (record.values.size() != fields.size()) {
        violation(schema, "values", FieldValue(static_cast<int64_t>(record.values.size())),
                  "expected " + std::to_string(fields.size()) + " fields");
    }

    if (record.common.module_id.empty()) {
        violation(schema, "module_id", FieldValue(std::string()), "empty identity");
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& spec = fields[i];
        const FieldValue& value = record.values[i];

        if (std::holds_alternative<std::monostate>(value)) {
            if (!spec.nullable) {
                violation(schema, spec.name, value, "null in a non-nullable field");
            }
            continue;
        }

        switch (spec.type) {
            case FieldType::Bool:
                if (!std::holds_alternative<bool>(value)) {
                    violation(schema, spec.name, value, "expected bool");
                }
                break;
            case FieldType::Int:
                if (!std::holds_alternative<int64_t>(value)) {
                    violation(schema, spec.name, value, "expected int");
                }
                check_range(schema, spec, value, static_cast<double>(std::get<int64_t>(value)));
                break;
            case FieldType::Double: {
                if (!std::holds_alternative<double>(value)) {
                    violation(schema, spec.name, value, "expected double");
                }
                double number = std::get<double>(value);
                if (!std::isfinite(number)) {
                    violation(schema, spec.name, value, "not a finite number");
                }
                check_range(schema, spec, value, number);
                break;
            }
            case FieldType::String: {
                if (!std::holds_alternative<std::string>(value)) {
                    violation(schema, spec.name, value, "expected string");
                }
                const auto& text = std::get<std::string>(value);
                if (!spec.allowed.empty() &&
                    std::find(spec.allowed.begin(), spec.allowed.end(), text) == spec.allowed.end()) {
                    violation(schema, spec.name, value, "not one of the allowed values");
                }
                break;
            }
        }
    }
}
