#include "ParameterContext.hpp"
#include "EnvironmentProfile.hpp"
#include "StringUtils.hpp"
#include "TableKind.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

std::string environment_help() {
    return "Environment profile (" + StringUtils::join(EnvironmentProfile::names(), ", ") + ")";
}

std::string tables_help() {
    std::vector<std::string> names;
    for (TableKind kind : ALL_TABLE_KINDS) {
        names.emplace_back(table_kind_to_string(kind));
    }
    return "Comma separated tables to generate (" + StringUtils::join(names, ",") + ")";
}

int64_t parse_int(const std::string& text, const std::string& field) {
    std::string value = text;
    StringUtils::trim(value);
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError(field, "expected an integer, got '" + text + "'");
    }
}

uint64_t parse_seed(const std::string& text, const std::string& field) {
    std::string value = text;
    StringUtils::trim(value);
    if (value.empty() || value[0] == '-') {
        throw ConfigurationError(field, "expected a non-negative integer, got '" + text + "'");
    }
    try {
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError(field, "expected a non-negative integer, got '" + text + "'");
    }
}

double parse_double(const std::string& text, const std::string& field) {
    std::string value = text;
    StringUtils::trim(value);
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError(field, "expected a number, got '" + text + "'");
    }
}

size_t parse_positive(const std::string& text, const std::string& field) {
    int64_t value = parse_int(text, field);
    if (value < 1) {
        throw ConfigurationError(field, "must be at least 1, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

Timestamp parse_date(const std::string& text) {
    try {
        return TimestampUtils::parse_datetime(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("date_range", e.what());
    }
}

}

ParameterContext::ParameterContext() {}

const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--start-date", 's', "Start of the time range (UTC, inclusive)", true},
    {"--end-date", 'e', "End of the time range (UTC, exclusive)", true},
    {"--rows", 'n', "Rows per table", true},
    {"--environment", 'E', environment_help(), true},
    {"--devices", 'd', "Number of devices, overrides the profile size", true},
    {"--fault-ratio", 'f', "Fraction of rows carrying an injected fault, 0 to 1", true},
    {"--seed", 'S', "Random seed; drawn and reported when absent", true},
    {"--output-dir", 'o', "Output directory", true},
    {"--format", 'F', "Output format: csv or jsonl", true},
    {"--compression", 'z', "Output compression: none, gzip, lz4 or zstd", true},
    {"--tables", 't', tables_help(), true},
    {"--concurrency", 'j', "Number of table jobs run in parallel", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help(std::ostream& out) {
    out << "Usage: telgen [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        out << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            out << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset > current_len ? desc_offset - current_len : 1;
        out << std::string(padding, ' ');
        out << opt.description << "\n";
    }

    out << "\nEnvironment variables:\n"
              << "  TELGEN_SEED, TELGEN_OUTPUT_DIR, TELGEN_ENVIRONMENT, TELGEN_LOG_DIR\n"
              << "\nExamples:\n"
              << "  telgen --config-file=conf/lab.yaml\n"
              << "  telgen -s 2025-03-01 -e 2025-03-02 -n 1000 -E lab -d 5 -f 0.1 -S 42\n\n";
}

void ParameterContext::show_version() {
    std::cout << "telgen version: " << TELGEN_VERSION << std::endl;
}

void ParameterContext::parse_tables(const YAML::Node& tables_node) {
    if (!tables_node.IsMap()) {
        throw ConfigurationError("tables", "expected a mapping of table names");
    }
    for (auto it = tables_node.begin(); it != tables_node.end(); ++it) {
        TableKind kind = string_to_table_kind(it->first.as<std::string>());
        TableRequest& table = config_data.request.table(kind);
        YAML::convert<TableRequest>::decode(it->second, table);
        table.kind = kind;
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }

    static const std::set<std::string> valid_keys = {"global", "generation", "output", "tables"};
    YAML::check_unknown_keys(config, valid_keys, "");

    if (config["global"]) {
        config_data.global = config["global"].as<GlobalConfig>();
    }
    if (config["generation"]) {
        config_data.request = config["generation"].as<GenerationRequest>();
    }
    if (config["output"]) {
        config_data.output = config["output"].as<OutputConfig>();
    }
    if (config["tables"]) {
        parse_tables(config["tables"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(file_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("config-file", "failed to parse YAML file '" + file_path + "': " + e.what());
    }
    merge_yaml(config);
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    } else {
        load_default_config();
    }
}

void ParameterContext::load_default_config() {
    YAML::Node config = YAML::Load(R"(
global:
  verbose: false
  log_dir: log

generation:
  start_date: "2025-03-01"
  end_date: "2025-04-01"
  rows_per_table: 10000
  environment: datacenter
  fault_ratio: 0.01
  concurrency: 1
  lifecycle_samples_per_prediction: 1

output:
  directory: output
  format: csv
  compression: none
)");

    merge_yaml(config);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw ConfigurationError(key, "unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                if (i + 1 >= argc) {
                    throw ConfigurationError(key, "option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw ConfigurationError(arg, "invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw ConfigurationError(arg, "unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw ConfigurationError(key, "option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw ConfigurationError(arg, "unexpected argument '" + arg + "'");
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& request = config_data.request;
    auto& output = config_data.output;

    if (cli_params.count("--start-date"))
        request.range.start = parse_date(cli_params["--start-date"]);

    if (cli_params.count("--end-date"))
        request.range.end = parse_date(cli_params["--end-date"]);

    if (cli_params.count("--rows"))
        request.rows_per_table = parse_int(cli_params["--rows"], "rows_per_table");

    if (cli_params.count("--environment"))
        request.environment = cli_params["--environment"];

    if (cli_params.count("--devices"))
        request.device_count = parse_int(cli_params["--devices"], "device_count");

    if (cli_params.count("--fault-ratio"))
        request.fault_ratio = parse_double(cli_params["--fault-ratio"], "fault_ratio");

    if (cli_params.count("--seed"))
        request.seed = parse_seed(cli_params["--seed"], "seed");

    if (cli_params.count("--tables"))
        request.select_tables(cli_params["--tables"]);

    if (cli_params.count("--concurrency"))
        request.concurrency = parse_positive(cli_params["--concurrency"], "concurrency");

    if (cli_params.count("--output-dir"))
        output.directory = cli_params["--output-dir"];

    if (cli_params.count("--format"))
        output.format = string_to_output_format(cli_params["--format"]);

    if (cli_params.count("--compression"))
        output.compression = string_to_compression(cli_params["--compression"]);

    if (cli_params.count("--verbose"))
        config_data.global.verbose = true;
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"TELGEN_SEED", "seed"},
        {"TELGEN_OUTPUT_DIR", "output_dir"},
        {"TELGEN_ENVIRONMENT", "environment"},
        {"TELGEN_LOG_DIR", "log_dir"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value || *env_value == '\0') {
            continue;
        }
        if (key == "seed") {
            config_data.request.seed = parse_seed(env_value, env_var);
        } else if (key == "output_dir") {
            config_data.output.directory = env_value;
        } else if (key == "environment") {
            config_data.request.environment = env_value;
        } else if (key == "log_dir") {
            config_data.global.log_dir = env_value;
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();

    config_data.request.validate();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const GenerationRequest& ParameterContext::get_request() const {
    return config_data.request;
}

const OutputConfig& ParameterContext::get_output_config() const {
    return config_data.output;
}
