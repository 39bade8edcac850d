#include "ZstdCompressor.hpp"
#include <zstd.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

struct DCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

size_t check(size_t code, const char* what) {
    if (ZSTD_isError(code)) {
        throw std::runtime_error(std::string("zstd: ") + what + " failed: " + ZSTD_getErrorName(code));
    }
    return code;
}

}

std::string ZstdCompressor::compress_frame(std::string_view data) const {
    std::vector<char> frame(ZSTD_compressBound(data.size()));
    size_t size = check(ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), LEVEL),
                        "ZSTD_compress");
    return std::string(frame.data(), size);
}

std::string ZstdCompressor::decompress_frames(std::string_view data) const {
    if (data.empty()) return {};

    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
    if (!ctx) {
        throw std::runtime_error("zstd: ZSTD_createDCtx failed");
    }

    std::vector<char> chunk(ZSTD_DStreamOutSize());
    std::string text;
    ZSTD_inBuffer input{data.data(), data.size(), 0};
    size_t remaining = 0;

    // The streaming decoder walks across concatenated frames
    for (;;) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        remaining = check(ZSTD_decompressStream(ctx.get(), &output, &input), "ZSTD_decompressStream");
        text.append(chunk.data(), output.pos);
        if (input.pos == input.size && output.pos < output.size) break;
    }

    if (remaining != 0) {
        throw std::runtime_error("zstd: truncated frame");
    }
    return text;
}
