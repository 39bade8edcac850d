#include "Compressor.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

std::string sample_text(size_t lines) {
    std::string text;
    for (size_t i = 0; i < lines; ++i) {
        text += "2025-03-01 00:00:00,Finisar-DC1-Pod01-Rack01-leaf-001-Ethernet1/" + std::to_string(i) + "-100G\n";
    }
    return text;
}

void test_none_compressor() {
    std::string data = "hello world";
    std::string compressed = Compressor::compress(data, CompressionType::NONE);
    std::string decompressed = Compressor::decompress(compressed, CompressionType::NONE);
    assert(compressed == data);
    assert(decompressed == data);
    std::cout << "test_none_compressor passed.\n";
}

void test_round_trip(CompressionType type) {
    std::string data = sample_text(200);
    std::string compressed = Compressor::compress(data, type);
    assert(compressed != data);
    assert(compressed.size() < data.size());
    assert(Compressor::decompress(compressed, type) == data);
    std::cout << "test_round_trip " << compression_to_string(type) << " passed.\n";
}

void test_concatenated_frames(CompressionType type) {
    std::string a = sample_text(10);
    std::string b = sample_text(5000);
    std::string c = "last line\n";
    auto codec = Compressor::create(type);
    assert(codec->type() == type);
    std::string stream = codec->compress_frame(a) + codec->compress_frame(b) + codec->compress_frame(c);
    assert(codec->decompress_frames(stream) == a + b + c);
    std::cout << "test_concatenated_frames " << compression_to_string(type) << " passed.\n";
}

void test_truncated_stream(CompressionType type) {
    std::string compressed = Compressor::compress(sample_text(100), type);
    bool caught = false;
    try {
        Compressor::decompress(compressed.substr(0, compressed.size() / 2), type);
    } catch (const std::runtime_error&) {
        caught = true;
    }
    (void)caught;
    assert(caught);
    std::cout << "test_truncated_stream " << compression_to_string(type) << " passed.\n";
}

void test_invalid_type() {
    std::string data = "invalid type";
    bool caught = false;
    try {
        Compressor::compress(data, static_cast<CompressionType>(999));
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()).find("Unsupported compression type") != std::string::npos);
        caught = true;
    }
    (void)caught;
    assert(caught);
    std::cout << "test_invalid_type passed.\n";
}

int main() {
    test_none_compressor();
    for (CompressionType type : {CompressionType::GZIP, CompressionType::LZ4, CompressionType::ZSTD}) {
        test_round_trip(type);
        test_concatenated_frames(type);
        test_truncated_stream(type);
    }
    test_invalid_type();
    std::cout << "All Compressor tests passed.\n";
    return 0;
}
