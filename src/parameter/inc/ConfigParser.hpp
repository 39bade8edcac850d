#pragma once

#include "ConfigData.hpp"
#include "TelgenErrors.hpp"
#include "TimestampUtils.hpp"

#include <set>
#include <string>

#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigurationError(context, "expected a mapping");
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw ConfigurationError(context.empty() ? key : context + "." + key,
                                         "unknown configuration key '" + key + "'");
            }
        }
    }

    // Typed read that reports the offending key instead of a bare conversion error
    template<typename T>
    T read_field(const Node& node, const std::string& key, const std::string& context) {
        try {
            return node[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(context + "." + key, "invalid value: " + std::string(e.what()));
        }
    }

    inline Timestamp read_datetime(const Node& node, const std::string& key, const std::string& field) {
        std::string text = read_field<std::string>(node, key, "generation");
        try {
            return TimestampUtils::parse_datetime(text);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(field, e.what());
        }
    }

    inline size_t read_positive(const Node& node, const std::string& key, const std::string& context) {
        int64_t value = read_field<int64_t>(node, key, context);
        if (value < 1) {
            throw ConfigurationError(key, "must be at least 1, got " + std::to_string(value));
        }
        return static_cast<size_t>(value);
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            static const std::set<std::string> valid_keys = {"verbose", "log_dir"};
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) {
                rhs.verbose = read_field<bool>(node, "verbose", "global");
            }
            if (node["log_dir"]) {
                rhs.log_dir = read_field<std::string>(node, "log_dir", "global");
            }
            return true;
        }
    };

    template<>
    struct convert<GenerationRequest> {
        static bool decode(const Node& node, GenerationRequest& rhs) {
            static const std::set<std::string> valid_keys = {
                "start_date", "end_date", "rows_per_table", "environment", "device_count",
                "fault_ratio", "seed", "concurrency", "lifecycle_samples_per_prediction"
            };
            check_unknown_keys(node, valid_keys, "generation");

            if (node["start_date"]) {
                rhs.range.start = read_datetime(node, "start_date", "date_range");
            }
            if (node["end_date"]) {
                rhs.range.end = read_datetime(node, "end_date", "date_range");
            }
            if (node["rows_per_table"]) {
                rhs.rows_per_table = read_field<int64_t>(node, "rows_per_table", "generation");
            }
            if (node["environment"]) {
                rhs.environment = read_field<std::string>(node, "environment", "generation");
            }
            if (node["device_count"] && !node["device_count"].IsNull()) {
                rhs.device_count = read_field<int64_t>(node, "device_count", "generation");
            }
            if (node["fault_ratio"]) {
                rhs.fault_ratio = read_field<double>(node, "fault_ratio", "generation");
            }
            if (node["seed"] && !node["seed"].IsNull()) {
                rhs.seed = read_field<uint64_t>(node, "seed", "generation");
            }
            if (node["concurrency"]) {
                rhs.concurrency = read_positive(node, "concurrency", "generation");
            }
            if (node["lifecycle_samples_per_prediction"]) {
                rhs.lifecycle_samples_per_prediction =
                    read_positive(node, "lifecycle_samples_per_prediction", "generation");
            }
            return true;
        }
    };

    template<>
    struct convert<OutputConfig> {
        static bool decode(const Node& node, OutputConfig& rhs) {
            static const std::set<std::string> valid_keys = {"directory", "format", "compression"};
            check_unknown_keys(node, valid_keys, "output");

            if (node["directory"]) {
                rhs.directory = read_field<std::string>(node, "directory", "output");
            }
            if (node["format"]) {
                rhs.format = string_to_output_format(read_field<std::string>(node, "format", "output"));
            }
            if (node["compression"]) {
                rhs.compression = string_to_compression(read_field<std::string>(node, "compression", "output"));
            }
            return true;
        }
    };

    // Decodes one entry of the tables mapping; the caller sets the kind from the key
    template<>
    struct convert<TableRequest> {
        static bool decode(const Node& node, TableRequest& rhs) {
            static const std::set<std::string> valid_keys = {"enabled", "output"};
            check_unknown_keys(node, valid_keys, "tables");

            if (node["enabled"]) {
                rhs.enabled = read_field<bool>(node, "enabled", "tables");
            }
            if (node["output"]) {
                rhs.output = read_field<std::string>(node, "output", "tables");
            }
            return true;
        }
    };

}
