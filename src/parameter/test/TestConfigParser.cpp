#include <iostream>
#include <cassert>
#include <string>
#include <yaml-cpp/yaml.h>
#include "ConfigParser.hpp"

template <typename T>
std::string decode_error_field(const std::string& yaml) {
    try {
        YAML::Load(yaml).as<T>();
    } catch (const ConfigurationError& e) {
        return e.field();
    }
    return "";
}

void test_GlobalConfig() {
    YAML::Node node = YAML::Load(R"(
verbose: true
log_dir: /var/log/telgen
)");
    GlobalConfig global = node.as<GlobalConfig>();
    assert(global.verbose == true);
    assert(global.log_dir == "/var/log/telgen");

    assert(decode_error_field<GlobalConfig>("verbose: true\nlevel: 3\n") == "global.level");
    std::cout << "test_GlobalConfig passed\n";
}

void test_GenerationRequest() {
    YAML::Node node = YAML::Load(R"(
start_date: 2025-03-01
end_date: "2025-03-02 12:00:00"
rows_per_table: 5000
environment: enterprise
device_count: 40
fault_ratio: 0.05
seed: 123456789
concurrency: 4
lifecycle_samples_per_prediction: 6
)");
    GenerationRequest request = node.as<GenerationRequest>();
    assert(request.range.start == 1740787200);
    assert(request.range.end == 1740787200 + 86400 + 12 * 3600);
    assert(request.rows_per_table == 5000);
    assert(request.environment == "enterprise");
    assert(request.device_count && *request.device_count == 40);
    assert(request.fault_ratio == 0.05);
    assert(request.seed && *request.seed == 123456789ULL);
    assert(request.concurrency == 4);
    assert(request.lifecycle_samples_per_prediction == 6);

    // Absent keys keep their defaults
    GenerationRequest partial = YAML::Load("rows_per_table: 10\n").as<GenerationRequest>();
    assert(partial.environment == "datacenter");
    assert(!partial.seed);
    assert(!partial.device_count);
    assert(partial.is_enabled(TableKind::Lifecycle));

    GenerationRequest nulls = YAML::Load("seed: ~\ndevice_count: ~\n").as<GenerationRequest>();
    assert(!nulls.seed && !nulls.device_count);
    std::cout << "test_GenerationRequest passed\n";
}

void test_GenerationRequest_errors() {
    assert(decode_error_field<GenerationRequest>("start_date: yesterday-ish\n") == "date_range");
    assert(decode_error_field<GenerationRequest>("rows_per_table: lots\n") == "generation.rows_per_table");
    assert(decode_error_field<GenerationRequest>("fault_ratio: [1, 2]\n") == "generation.fault_ratio");
    assert(decode_error_field<GenerationRequest>("concurrency: 0\n") == "concurrency");
    assert(decode_error_field<GenerationRequest>("lifecycle_samples_per_prediction: -2\n") ==
           "lifecycle_samples_per_prediction");
    assert(decode_error_field<GenerationRequest>("rows: 10\n") == "generation.rows");
    std::cout << "test_GenerationRequest_errors passed\n";
}

void test_OutputConfig() {
    YAML::Node node = YAML::Load(R"(
directory: /tmp/telemetry
format: jsonl
compression: zstd
)");
    OutputConfig output = node.as<OutputConfig>();
    assert(output.directory == "/tmp/telemetry");
    assert(output.format == OutputFormat::JsonLines);
    assert(output.compression == CompressionType::ZSTD);

    assert(decode_error_field<OutputConfig>("format: parquet\n") == "format");
    assert(decode_error_field<OutputConfig>("compression: bzip2\n") == "compression");
    assert(decode_error_field<OutputConfig>("path: out\n") == "output.path");
    std::cout << "test_OutputConfig passed\n";
}

void test_TableRequest() {
    TableRequest table{TableKind::Ddm, true, "ddm_data"};
    YAML::convert<TableRequest>::decode(YAML::Load("enabled: false\n"), table);
    assert(table.enabled == false);
    assert(table.output == "ddm_data");
    assert(table.kind == TableKind::Ddm);

    YAML::convert<TableRequest>::decode(YAML::Load("output: optics\n"), table);
    assert(table.output == "optics");

    assert(decode_error_field<TableRequest>("enabled: true\nformat: csv\n") == "tables.format");
    assert(decode_error_field<TableRequest>("enabled: maybe\n") == "tables.enabled");
    std::cout << "test_TableRequest passed\n";
}

int main() {
    test_GlobalConfig();
    test_GenerationRequest();
    test_GenerationRequest_errors();
    test_OutputConfig();
    test_TableRequest();
    std::cout << "All ConfigParser tests passed\n";
    return 0;
}
