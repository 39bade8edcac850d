#include "GzipCompressor.hpp"
#include <zlib.h>
#include <array>
#include <stdexcept>

namespace {

// windowBits 15 plus 16 selects the gzip wrapper instead of raw zlib
constexpr int GZIP_WINDOW_BITS = 15 | 16;
constexpr size_t CHUNK_SIZE = 32 * 1024;

Bytef* input_bytes(std::string_view data) {
    return reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
}

struct DeflateStream {
    z_stream zs{};

    DeflateStream() {
        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("gzip: deflateInit2 failed");
        }
    }
    ~DeflateStream() { deflateEnd(&zs); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
};

struct InflateStream {
    z_stream zs{};

    InflateStream() {
        if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
            throw std::runtime_error("gzip: inflateInit2 failed");
        }
    }
    ~InflateStream() { inflateEnd(&zs); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

}

std::string GzipCompressor::compress_frame(std::string_view data) const {
    DeflateStream stream;
    z_stream& zs = stream.zs;
    zs.next_in = input_bytes(data);
    zs.avail_in = static_cast<uInt>(data.size());

    std::array<char, CHUNK_SIZE> buffer;
    std::string frame;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw std::runtime_error("gzip: deflate failed with code " + std::to_string(ret));
        }
        frame.append(buffer.data(), buffer.size() - zs.avail_out);
    }
    return frame;
}

std::string GzipCompressor::decompress_frames(std::string_view data) const {
    if (data.empty()) return {};

    InflateStream stream;
    z_stream& zs = stream.zs;
    zs.next_in = input_bytes(data);
    zs.avail_in = static_cast<uInt>(data.size());

    std::array<char, CHUNK_SIZE> buffer;
    std::string text;
    for (;;) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        int ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw std::runtime_error("gzip: inflate failed with code " + std::to_string(ret));
        }
        text.append(buffer.data(), buffer.size() - zs.avail_out);

        if (ret == Z_STREAM_END) {
            if (zs.avail_in == 0) break;
            // next member
            if (inflateReset(&zs) != Z_OK) {
                throw std::runtime_error("gzip: inflateReset failed");
            }
        } else if (zs.avail_in == 0 && zs.avail_out != 0) {
            throw std::runtime_error("gzip: truncated member");
        }
    }
    return text;
}
