#pragma once
#include "Compressor.hpp"

class Lz4Compressor : public BaseCompressor {
public:
    CompressionType type() const override { return CompressionType::LZ4; }
    std::string compress_frame(std::string_view data) const override;
    std::string decompress_frames(std::string_view data) const override;
};
