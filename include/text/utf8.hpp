#pragma once

#include <cstddef>
#include <string>

namespace wcodec {

// Returns true when `bytes` is well-formed UTF-8 (RFC 3629: no overlongs,
// no surrogates, nothing above U+10FFFF). On failure `bad_offset` receives
// the byte offset of the first offending sequence.
bool utf8_valid(const std::string& bytes, size_t* bad_offset = nullptr);

// Number of code points in bytes[0, byte_offset). Continuation bytes are
// not counted, so this is also meaningful for malformed input.
size_t utf8_position(const std::string& bytes, size_t byte_offset);

} // namespace wcodec
