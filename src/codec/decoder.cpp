#include "codec/decoder.hpp"

#include "bits/bitstream.hpp"
#include "codec/tokenizer.hpp"
#include "text/utf8.hpp"

#include <cstdio>
#include <vector>

namespace wcodec {

CodecStatus decode_from_tokens(const SymbolTable& table,
                               const std::string& tokens,
                               int bit_width,
                               std::string& out,
                               DecodeStats* stats) {
    out.clear();
    if (!valid_bit_width(bit_width)) {
        return CodecStatus::failure(ErrorKind::InvalidBitWidth, 0,
                                    "bit width " + std::to_string(bit_width) + " is out of range");
    }

    //===Segment===//
    std::vector<TokenSpan> spans;
    CodecStatus st = segment_tokens(table, tokens, spans);
    if (!st.ok()) return st;

    //===Tokens -> chunks -> bytes===//
    const uint32_t limit = 1u << bit_width;
    ByteAssembler assembler(bit_width);
    std::string tok;
    for (const TokenSpan& sp : spans) {
        tok.assign(tokens, sp.offset, sp.length);
        uint32_t idx = 0;
        if (!table.index_for(tok, idx)) {
            return CodecStatus::failure(ErrorKind::UnknownSymbol, sp.offset,
                                        "token '" + tok + "' has no index");
        }
        if (idx == table.pad_index()) {
            assembler.write_chunk(0);
        } else if (idx >= limit) {
            return CodecStatus::failure(ErrorKind::UnknownSymbol, sp.offset,
                                        "index " + std::to_string(idx) + " of token '" + tok +
                                        "' does not fit in " + std::to_string(bit_width) + " bits");
        } else {
            assembler.write_chunk(idx);
        }
    }

#ifndef NDEBUG
    std::fprintf(stderr, "decode: %zu tokens -> %zu bytes (%zu zero bytes dropped)\n",
                 spans.size(), assembler.bytes().size(), assembler.zero_bytes_dropped());
    if (!assembler.bytes().empty()) {
        std::fprintf(stderr, "First bytes: %s\n", bytes_to_bits(assembler.bytes().substr(0, 8)).c_str());
    }
#endif

    //===Validate text===//
    const std::string& bytes = assembler.bytes();
    size_t bad = 0;
    if (!utf8_valid(bytes, &bad)) {
        return CodecStatus::failure(ErrorKind::InvalidEncoding, bad,
                                    "decoded bytes are not valid UTF-8 at byte " + std::to_string(bad));
    }
    if (stats) {
        stats->tokens = spans.size();
        stats->zero_bytes_dropped = assembler.zero_bytes_dropped();
    }
    out = bytes;
    return CodecStatus::success();
}

} // namespace wcodec
