#include "text/utf8.hpp"

#include <algorithm>
#include <cstdint>

namespace wcodec {

namespace {

static bool is_cont(uint8_t b) { return (b & 0xC0u) == 0x80u; }

// Length of the sequence starting at bytes[i], or 0 if malformed.
static size_t sequence_length(const std::string& bytes, size_t i) {
    const size_t n = bytes.size();
    const uint8_t b0 = static_cast<uint8_t>(bytes[i]);
    if (b0 < 0x80u) return 1;

    size_t len = 0;
    uint8_t lo = 0x80u, hi = 0xBFu; // allowed range of the second byte
    if (b0 >= 0xC2u && b0 <= 0xDFu) {
        len = 2;
    } else if (b0 == 0xE0u) {
        len = 3; lo = 0xA0u;
    } else if (b0 >= 0xE1u && b0 <= 0xECu) {
        len = 3;
    } else if (b0 == 0xEDu) {
        len = 3; hi = 0x9Fu;
    } else if (b0 >= 0xEEu && b0 <= 0xEFu) {
        len = 3;
    } else if (b0 == 0xF0u) {
        len = 4; lo = 0x90u;
    } else if (b0 >= 0xF1u && b0 <= 0xF3u) {
        len = 4;
    } else if (b0 == 0xF4u) {
        len = 4; hi = 0x8Fu;
    } else {
        return 0;
    }
    if (i + len > n) return 0;

    const uint8_t b1 = static_cast<uint8_t>(bytes[i + 1]);
    if (b1 < lo || b1 > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (!is_cont(static_cast<uint8_t>(bytes[i + k]))) return 0;
    }
    return len;
}

} // namespace

bool utf8_valid(const std::string& bytes, size_t* bad_offset) {
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = sequence_length(bytes, i);
        if (len == 0) {
            if (bad_offset) *bad_offset = i;
            return false;
        }
        i += len;
    }
    return true;
}

size_t utf8_position(const std::string& bytes, size_t byte_offset) {
    const size_t end = std::min(byte_offset, bytes.size());
    size_t count = 0;
    for (size_t i = 0; i < end; ++i) {
        if (!is_cont(static_cast<uint8_t>(bytes[i]))) ++count;
    }
    return count;
}

} // namespace wcodec
