#include "codec/word_codec.hpp"

#include "codec/encoder.hpp"

namespace wcodec {

std::shared_ptr<const WordCodec> WordCodec::create(const SymbolTableConfig& cfg) {
    return std::make_shared<const WordCodec>(SymbolTable::build(cfg));
}

CodecStatus WordCodec::encode(const std::string& text, std::string& out) const {
    return encode_to_tokens(table_, text, table_.bit_width(), out);
}

CodecStatus WordCodec::encode(const std::string& text, int bit_width, std::string& out) const {
    return encode_to_tokens(table_, text, bit_width, out);
}

CodecStatus WordCodec::decode(const std::string& tokens, std::string& out, DecodeStats* stats) const {
    return decode_from_tokens(table_, tokens, table_.bit_width(), out, stats);
}

CodecStatus WordCodec::decode(const std::string& tokens, int bit_width, std::string& out,
                              DecodeStats* stats) const {
    return decode_from_tokens(table_, tokens, bit_width, out, stats);
}

} // namespace wcodec
