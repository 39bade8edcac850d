#include "TelgenErrors.hpp"

ConfigurationError::ConfigurationError(const std::string& field, const std::string& message)
    : std::runtime_error("Invalid configuration for '" + field + "': " + message),
      field_(field) {}

SchemaViolationError::SchemaViolationError(const std::string& table, const std::string& field,
                                           const std::string& value, const std::string& reason)
    : std::runtime_error("Schema violation in table '" + table + "', field '" + field +
                         "', value '" + value + "': " + reason),
      table_(table), field_(field), value_(value) {}

SinkWriteError::SinkWriteError(const std::string& table, int64_t last_batch_index, const std::string& message)
    : std::runtime_error("Sink write failed for table '" + table + "' after batch " +
                         std::to_string(last_batch_index) + ": " + message),
      table_(table), last_batch_index_(last_batch_index) {}
