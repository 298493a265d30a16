#include "bits/bitstream.hpp"

#include <stdexcept>

namespace wcodec {

ChunkWriter::ChunkWriter(int bit_width) : width_(bit_width) {
    if (!valid_bit_width(bit_width)) throw std::runtime_error("ChunkWriter: invalid bit width");
}

void ChunkWriter::write_byte(uint8_t b) {
    acc_ = (acc_ << 8) | b;
    nbits_ += 8;
    const uint32_t mask = (1u << width_) - 1u;
    while (nbits_ >= width_) {
        nbits_ -= width_;
        chunks_.push_back((acc_ >> nbits_) & mask);
    }
    acc_ &= (1u << nbits_) - 1u;
}

void ChunkWriter::flush() {
    if (nbits_ > 0) {
        const uint32_t mask = (1u << width_) - 1u;
        chunks_.push_back((acc_ << (width_ - nbits_)) & mask);
        acc_ = 0;
        nbits_ = 0;
    }
}

ByteAssembler::ByteAssembler(int bit_width) : width_(bit_width) {
    if (!valid_bit_width(bit_width)) throw std::runtime_error("ByteAssembler: invalid bit width");
}

void ByteAssembler::write_chunk(uint32_t value) {
    acc_ = (acc_ << width_) | (value & ((1u << width_) - 1u));
    nbits_ += width_;
    while (nbits_ >= 8) {
        nbits_ -= 8;
        uint8_t b = static_cast<uint8_t>((acc_ >> nbits_) & 0xFFu);
        ++seen_;
        if (b == 0) {
            ++dropped_;
        } else {
            out_.push_back(static_cast<char>(b));
        }
    }
    acc_ &= (1u << nbits_) - 1u;
}

std::string chunk_to_bits(uint32_t value, int bit_width) {
    std::string s;
    s.reserve(static_cast<size_t>(bit_width));
    for (int i = bit_width - 1; i >= 0; --i) {
        s.push_back(((value >> i) & 1u) ? '1' : '0');
    }
    return s;
}

std::string bytes_to_bits(const std::string& bytes) {
    std::string s;
    s.reserve(bytes.size() * 8);
    for (char c : bytes) s += chunk_to_bits(static_cast<uint8_t>(c), 8);
    return s;
}

} // namespace wcodec
