#include "Compressor.hpp"
#include "GzipCompressor.hpp"
#include "Lz4Compressor.hpp"
#include "ZstdCompressor.hpp"
#include <stdexcept>

namespace {

class PassThroughCompressor : public BaseCompressor {
public:
    CompressionType type() const override { return CompressionType::NONE; }
    std::string compress_frame(std::string_view data) const override { return std::string(data); }
    std::string decompress_frames(std::string_view data) const override { return std::string(data); }
};

}

std::unique_ptr<BaseCompressor> Compressor::create(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return std::make_unique<PassThroughCompressor>();
        case CompressionType::GZIP: return std::make_unique<GzipCompressor>();
        case CompressionType::LZ4:  return std::make_unique<Lz4Compressor>();
        case CompressionType::ZSTD: return std::make_unique<ZstdCompressor>();
    }
    throw std::invalid_argument("Unsupported compression type: " +
                                std::to_string(static_cast<int>(type)));
}

std::string Compressor::compress(std::string_view data, CompressionType type) {
    return create(type)->compress_frame(data);
}

std::string Compressor::decompress(std::string_view data, CompressionType type) {
    return create(type)->decompress_frames(data);
}
