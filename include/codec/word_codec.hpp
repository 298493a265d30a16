#pragma once

#include <memory>
#include <string>
#include <utility>

#include "codec/codec_error.hpp"
#include "codec/decoder.hpp"
#include "codec/symbol_table.hpp"

namespace wcodec {

// Text <-> word-token codec over a fixed symbol table.
// Immutable after construction; share one instance between callers.
class WordCodec {
public:
    explicit WordCodec(SymbolTable table) : table_(std::move(table)) {}

    // Builds the table from `cfg`; throws std::runtime_error if invalid.
    static std::shared_ptr<const WordCodec> create(const SymbolTableConfig& cfg);

    const SymbolTable& table() const { return table_; }
    int bit_width() const { return table_.bit_width(); }

    // Uses the table's bit width.
    CodecStatus encode(const std::string& text, std::string& out) const;
    CodecStatus encode(const std::string& text, int bit_width, std::string& out) const;

    CodecStatus decode(const std::string& tokens, std::string& out, DecodeStats* stats = nullptr) const;
    CodecStatus decode(const std::string& tokens, int bit_width, std::string& out,
                       DecodeStats* stats = nullptr) const;

private:
    SymbolTable table_;
};

} // namespace wcodec
