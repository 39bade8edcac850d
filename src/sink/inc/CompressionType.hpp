#pragma once

#include <string>

enum class CompressionType {
    NONE,
    GZIP,
    LZ4,
    ZSTD
};

const char* compression_to_string(CompressionType type);

// Throws ConfigurationError(field "compression") for unknown names
CompressionType string_to_compression(const std::string& str);

// File name suffix, e.g. ".gz"; empty for NONE
const char* compression_suffix(CompressionType type);
