#include "GenerationRequest.hpp"
#include "EnvironmentProfile.hpp"
#include "StringUtils.hpp"
#include "TelgenErrors.hpp"
#include <cmath>
#include <set>

std::array<TableRequest, 5> GenerationRequest::default_tables() {
    std::array<TableRequest, 5> tables;
    for (TableKind kind : ALL_TABLE_KINDS) {
        tables[table_index(kind)] = TableRequest{kind, true, default_output_name(kind)};
    }
    return tables;
}

void GenerationRequest::select_tables(const std::string& comma_list) {
    auto names = StringUtils::split(comma_list, ',');
    if (names.empty()) {
        throw ConfigurationError("tables", "table list is empty");
    }

    for (auto& table : tables) {
        table.enabled = false;
    }
    for (const auto& name : names) {
        table(string_to_table_kind(name)).enabled = true;
    }
}

void GenerationRequest::validate() const {
    if (range.end < range.start) {
        throw ConfigurationError("date_range",
            "end " + TimestampUtils::format_datetime(range.end) +
            " is before start " + TimestampUtils::format_datetime(range.start));
    }
    if (range.end == range.start) {
        throw ConfigurationError("date_range", "range is empty (start equals end)");
    }

    if (rows_per_table < 0) {
        throw ConfigurationError("rows_per_table", "must not be negative, got " + std::to_string(rows_per_table));
    }

    if (!EnvironmentProfile::exists(environment)) {
        throw ConfigurationError("environment",
            "unknown profile '" + environment + "', expected one of: " +
            StringUtils::join(EnvironmentProfile::names(), ", "));
    }

    if (device_count) {
        if (*device_count <= 0) {
            throw ConfigurationError("device_count", "must be positive, got " + std::to_string(*device_count));
        }
        if (*device_count > MAX_DEVICE_COUNT) {
            throw ConfigurationError("device_count",
                "must not exceed " + std::to_string(MAX_DEVICE_COUNT) + ", got " + std::to_string(*device_count));
        }
    }

    if (std::isnan(fault_ratio) || fault_ratio < 0.0 || fault_ratio > 1.0) {
        throw ConfigurationError("fault_ratio", "must be within [0, 1], got " + std::to_string(fault_ratio));
    }

    if (concurrency == 0) {
        throw ConfigurationError("concurrency", "must be at least 1");
    }

    if (lifecycle_samples_per_prediction == 0) {
        throw ConfigurationError("lifecycle_samples_per_prediction", "must be at least 1");
    }

    std::set<std::string> outputs;
    bool any_enabled = false;
    for (const auto& t : tables) {
        if (!t.enabled) continue;
        any_enabled = true;

        std::string name = table_kind_to_string(t.kind);
        if (t.output.empty()) {
            throw ConfigurationError("tables." + name + ".output", "output name must not be empty");
        }
        if (t.output.find('/') != std::string::npos || t.output.find('\\') != std::string::npos) {
            throw ConfigurationError("tables." + name + ".output", "output name must not contain a path separator");
        }
        if (!outputs.insert(t.output).second) {
            throw ConfigurationError("tables." + name + ".output", "duplicate output name '" + t.output + "'");
        }
    }

    if (!any_enabled) {
        throw ConfigurationError("tables", "no table is enabled");
    }
}
