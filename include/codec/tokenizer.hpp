#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "codec/codec_error.hpp"
#include "codec/symbol_table.hpp"

namespace wcodec {

// One segmented token: where it starts in the input and how long it is.
struct TokenSpan {
    size_t offset;
    size_t length;
};

// Greedy longest-match segmentation of `text` against the table's tokens.
// At each position the longest token that matches wins. Fails with
// SegmentationFailure (byte offset + code point position) when nothing
// matches.
CodecStatus segment_tokens(const SymbolTable& table,
                           const std::string& text,
                           std::vector<TokenSpan>& spans);

} // namespace wcodec
