#include "codec/encoder.hpp"

#include "bits/bitstream.hpp"

#include <cstdio>
#include <utility>

namespace wcodec {

CodecStatus encode_to_tokens(const SymbolTable& table,
                             const std::string& text,
                             int bit_width,
                             std::string& out) {
    out.clear();
    if (!valid_bit_width(bit_width)) {
        return CodecStatus::failure(ErrorKind::InvalidBitWidth, 0,
                                    "bit width " + std::to_string(bit_width) + " is out of range");
    }

    //===Bytes -> chunks===//
    ChunkWriter w(bit_width);
    for (char c : text) w.write_byte(static_cast<uint8_t>(c));
    w.flush();
    const auto& chunks = w.chunks();

#ifndef NDEBUG
    std::fprintf(stderr, "encode: %zu bytes -> %zu chunks of %d bits\n",
                 text.size(), chunks.size(), bit_width);
    if (!chunks.empty()) {
        const size_t n = chunks.size() < 8 ? chunks.size() : 8;
        std::fprintf(stderr, "First bytes: %s\n", bytes_to_bits(text.substr(0, (n * bit_width + 7) / 8)).c_str());
        std::fprintf(stderr, "First chunks:");
        for (size_t i = 0; i < n; ++i) std::fprintf(stderr, " %s", chunk_to_bits(chunks[i], bit_width).c_str());
        std::fprintf(stderr, "\n");
    }
#endif

    //===Chunks -> tokens===//
    std::string result;
    for (size_t i = 0; i < chunks.size(); ++i) {
        // Every zero chunk maps to pad, never to index 0.
        const uint32_t idx = chunks[i] == 0 ? table.pad_index() : chunks[i];
        const std::string* tok = table.token_for(idx);
        if (!tok) {
            return CodecStatus::failure(ErrorKind::UndefinedSymbol, i,
                                        "no token for index " + std::to_string(idx) +
                                        " (chunk " + std::to_string(i) + ")");
        }
        result += *tok;
    }
    out = std::move(result);
    return CodecStatus::success();
}

} // namespace wcodec
