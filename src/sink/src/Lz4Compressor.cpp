#include "Lz4Compressor.hpp"
#include <lz4frame.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;

struct DecompressionContextDeleter {
    void operator()(LZ4F_dctx* ctx) const { LZ4F_freeDecompressionContext(ctx); }
};

using DecompressionContext = std::unique_ptr<LZ4F_dctx, DecompressionContextDeleter>;

size_t check(size_t code, const char* what) {
    if (LZ4F_isError(code)) {
        throw std::runtime_error(std::string("lz4: ") + what + " failed: " + LZ4F_getErrorName(code));
    }
    return code;
}

}

std::string Lz4Compressor::compress_frame(std::string_view data) const {
    LZ4F_preferences_t prefs{};
    prefs.frameInfo.contentSize = data.size();

    std::vector<char> frame(LZ4F_compressFrameBound(data.size(), &prefs));
    size_t size = check(LZ4F_compressFrame(frame.data(), frame.size(), data.data(), data.size(), &prefs),
                        "LZ4F_compressFrame");
    return std::string(frame.data(), size);
}

std::string Lz4Compressor::decompress_frames(std::string_view data) const {
    if (data.empty()) return {};

    LZ4F_dctx* raw = nullptr;
    check(LZ4F_createDecompressionContext(&raw, LZ4F_VERSION), "LZ4F_createDecompressionContext");
    DecompressionContext ctx(raw);

    std::vector<char> chunk(CHUNK_SIZE);
    std::string text;
    size_t consumed = 0;
    size_t hint = 1;

    // The context moves on to the next frame by itself once one ends
    while (consumed < data.size()) {
        size_t src_size = data.size() - consumed;
        size_t dst_size = chunk.size();
        hint = check(LZ4F_decompress(ctx.get(), chunk.data(), &dst_size, data.data() + consumed, &src_size, nullptr),
                     "LZ4F_decompress");
        consumed += src_size;
        text.append(chunk.data(), dst_size);
    }

    // Output still buffered in the context
    while (hint != 0) {
        size_t src_size = 0;
        size_t dst_size = chunk.size();
        hint = check(LZ4F_decompress(ctx.get(), chunk.data(), &dst_size, nullptr, &src_size, nullptr),
                     "LZ4F_decompress");
        if (dst_size == 0) {
            throw std::runtime_error("lz4: truncated frame");
        }
        text.append(chunk.data(), dst_size);
    }
    return text;
}
