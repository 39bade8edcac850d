#pragma once
#include "Compressor.hpp"

class ZstdCompressor : public BaseCompressor {
public:
    static constexpr int LEVEL = 3;

    CompressionType type() const override { return CompressionType::ZSTD; }
    std::string compress_frame(std::string_view data) const override;
    std::string decompress_frames(std::string_view data) const override;
};
