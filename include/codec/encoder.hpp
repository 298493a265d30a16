#pragma once

#include <string>

#include "codec/codec_error.hpp"
#include "codec/symbol_table.hpp"

namespace wcodec {

// Encode the bytes of `text` as tokens, `bit_width` bits per token.
// Zero-valued chunks (data or trailing padding) become the pad token.
CodecStatus encode_to_tokens(const SymbolTable& table,
                             const std::string& text,
                             int bit_width,
                             std::string& out);

} // namespace wcodec
