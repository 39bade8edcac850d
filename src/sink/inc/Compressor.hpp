#pragma once
#include "CompressionType.hpp"
#include <memory>
#include <string>
#include <string_view>

// A codec appends one self-contained frame per batch (gzip member, LZ4 frame,
// zstd frame); the concatenation of frames decodes as one stream.
class BaseCompressor {
public:
    virtual ~BaseCompressor() = default;

    virtual CompressionType type() const = 0;
    virtual std::string compress_frame(std::string_view data) const = 0;
    // Accepts any number of frames back to back; throws on truncated input
    virtual std::string decompress_frames(std::string_view data) const = 0;
};

class Compressor {
public:
    static std::unique_ptr<BaseCompressor> create(CompressionType type);

    static std::string compress(std::string_view data, CompressionType type);
    static std::string decompress(std::string_view data, CompressionType type);
};
