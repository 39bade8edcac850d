#include "CompressionType.hpp"
#include "StringUtils.hpp"
#include "TelgenErrors.hpp"

const char* compression_to_string(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return "none";
        case CompressionType::GZIP: return "gzip";
        case CompressionType::LZ4:  return "lz4";
        case CompressionType::ZSTD: return "zstd";
        default: return "unknown";
    }
}

CompressionType string_to_compression(const std::string& str) {
    std::string s = StringUtils::to_upper(str);
    if (s == "NONE" || s.empty()) return CompressionType::NONE;
    if (s == "GZIP" || s == "GZ") return CompressionType::GZIP;
    if (s == "LZ4")               return CompressionType::LZ4;
    if (s == "ZSTD" || s == "ZST") return CompressionType::ZSTD;
    throw ConfigurationError("compression", "unknown compression type '" + str + "'");
}

const char* compression_suffix(CompressionType type) {
    switch (type) {
        case CompressionType::GZIP: return ".gz";
        case CompressionType::LZ4:  return ".lz4";
        case CompressionType::ZSTD: return ".zst";
        default: return "";
    }
}
