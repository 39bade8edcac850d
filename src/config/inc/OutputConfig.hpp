#pragma once

#include "CompressionType.hpp"
#include <string>

enum class OutputFormat {
    Csv,
    JsonLines
};

const char* output_format_to_string(OutputFormat format);
OutputFormat string_to_output_format(const std::string& str);

// ".csv" or ".jsonl"
const char* output_format_extension(OutputFormat format);

struct OutputConfig {
    std::string directory = "output";
    OutputFormat format = OutputFormat::Csv;
    CompressionType compression = CompressionType::NONE;
};
