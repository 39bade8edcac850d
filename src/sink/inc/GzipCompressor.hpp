#pragma once
#include "Compressor.hpp"

class GzipCompressor : public BaseCompressor {
public:
    CompressionType type() const override { return CompressionType::GZIP; }
    std::string compress_frame(std::string_view data) const override;
    std::string decompress_frames(std::string_view data) const override;
};
