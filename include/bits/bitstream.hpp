#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wcodec {

inline constexpr int kMinBitWidth = 1;
inline constexpr int kMaxBitWidth = 16;

inline bool valid_bit_width(int bit_width) {
    return bit_width >= kMinBitWidth && bit_width <= kMaxBitWidth;
}

// Repacks an 8-bit byte stream into fixed-width chunks, MSB-first.
class ChunkWriter {
public:
    explicit ChunkWriter(int bit_width);

    void write_byte(uint8_t b);
    // Right-pads a trailing partial chunk with zero bits.
    void flush();

    const std::vector<uint32_t>& chunks() const { return chunks_; }
    int bit_width() const { return width_; }

private:
    int width_;
    uint32_t acc_{0};
    int nbits_{0}; // bits pending in acc_ (0..width_+7)
    std::vector<uint32_t> chunks_;
};

// Repacks fixed-width chunks into 8-bit bytes, MSB-first.
// A trailing partial byte is never emitted.
class ByteAssembler {
public:
    explicit ByteAssembler(int bit_width);

    void write_chunk(uint32_t value);

    // Number of complete bytes produced so far, including dropped ones.
    size_t bytes_seen() const { return seen_; }
    size_t zero_bytes_dropped() const { return dropped_; }
    const std::string& bytes() const { return out_; }

private:
    int width_;
    uint32_t acc_{0};
    int nbits_{0};
    size_t seen_{0};
    size_t dropped_{0};
    std::string out_;
};

// Bit-string helpers (MSB-first), used by the debug traces.
std::string chunk_to_bits(uint32_t value, int bit_width);
std::string bytes_to_bits(const std::string& bytes);

} // namespace wcodec
