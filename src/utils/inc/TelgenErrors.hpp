#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Invalid request, detected before any row is generated
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& field, const std::string& message);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// A synthesized value fell outside its documented domain
class SchemaViolationError : public std::runtime_error {
public:
    SchemaViolationError(const std::string& table, const std::string& field, const std::string& value,
                         const std::string& reason);

    const std::string& table() const { return table_; }
    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string table_;
    std::string field_;
    std::string value_;
};

// The sink rejected a batch; batches up to last_batch_index stay written
class SinkWriteError : public std::runtime_error {
public:
    SinkWriteError(const std::string& table, int64_t last_batch_index, const std::string& message);

    const std::string& table() const { return table_; }
    int64_t last_batch_index() const { return last_batch_index_; }

private:
    std::string table_;
    int64_t last_batch_index_;
};
