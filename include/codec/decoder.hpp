#pragma once

#include <cstddef>
#include <string>

#include "codec/codec_error.hpp"
#include "codec/symbol_table.hpp"

namespace wcodec {

struct DecodeStats {
    size_t tokens = 0;
    size_t zero_bytes_dropped = 0;
};

// Decode a concatenation of tokens back to UTF-8 text.
// All-zero bytes are dropped and a trailing partial byte is discarded.
CodecStatus decode_from_tokens(const SymbolTable& table,
                               const std::string& tokens,
                               int bit_width,
                               std::string& out,
                               DecodeStats* stats = nullptr);

} // namespace wcodec
