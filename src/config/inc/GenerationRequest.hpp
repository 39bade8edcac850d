#pragma once

#include "TableKind.hpp"
#include "TimestampUtils.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

struct TableRequest {
    TableKind kind = TableKind::Grpc;
    bool enabled = true;
    std::string output;
};

// Half-open UTC interval [start, end)
struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;

    int64_t duration() const { return end - start; }
};

struct GenerationRequest {
    static constexpr int64_t MAX_DEVICE_COUNT = 5000;

    // 2025-03-01 .. 2025-04-01
    TimeRange range{1740787200, 1743465600};
    int64_t rows_per_table = 10000;
    std::string environment = "datacenter";
    std::optional<int64_t> device_count;
    double fault_ratio = 0.01;
    std::optional<uint64_t> seed;
    size_t concurrency = 1;
    size_t lifecycle_samples_per_prediction = 1;
    std::array<TableRequest, 5> tables = default_tables();

    GenerationRequest() = default;

    const TableRequest& table(TableKind kind) const { return tables[table_index(kind)]; }
    TableRequest& table(TableKind kind) { return tables[table_index(kind)]; }
    bool is_enabled(TableKind kind) const { return table(kind).enabled; }

    // Enable exactly the listed tables
    void select_tables(const std::string& comma_list);

    // Throws ConfigurationError naming the first offending field
    void validate() const;

    static std::array<TableRequest, 5> default_tables();
};
