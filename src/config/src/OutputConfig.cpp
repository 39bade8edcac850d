#include "OutputConfig.hpp"
#include "StringUtils.hpp"
#include "TelgenErrors.hpp"

const char* output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Csv:       return "csv";
        case OutputFormat::JsonLines: return "jsonl";
        default: return "unknown";
    }
}

OutputFormat string_to_output_format(const std::string& str) {
    std::string s = StringUtils::to_lower(str);
    if (s == "csv") return OutputFormat::Csv;
    if (s == "jsonl" || s == "json" || s == "ndjson") return OutputFormat::JsonLines;
    throw ConfigurationError("format", "unknown output format '" + str + "', expected csv or jsonl");
}

const char* output_format_extension(OutputFormat format) {
    return format == OutputFormat::JsonLines ? ".jsonl" : ".csv";
}
