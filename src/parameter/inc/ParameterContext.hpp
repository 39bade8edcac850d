#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <iostream>
#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when --help or --version was handled and nothing should run.
    // Throws ConfigurationError for any invalid source or value.
    bool init(int argc, char* argv[]);
    void show_help(std::ostream& out = std::cout);
    void show_version();

    // Merge parameter sources, lowest priority first
    void parse_commandline(int argc, char* argv[]);
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();
    void merge_environment_vars();
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const GenerationRequest& get_request() const;
    const OutputConfig& get_output_config() const;

    bool has_option(const std::string& long_opt) const { return cli_params.count(long_opt) > 0; }

private:
    ConfigData config_data;

    // Command line options keyed by long name
    std::unordered_map<std::string, std::string> cli_params;

    void load_default_config();
    void parse_tables(const YAML::Node& tables_node);

    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--rows")
        char short_opt;          // Short option (e.g. 'n')
        std::string description;
        bool requires_value;
    };

    static const std::vector<CommandOption> valid_options;
};
