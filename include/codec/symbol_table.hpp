#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wcodec {

// Configuration boundary: decimal index strings -> tokens, plus the pad entry.
// Entries are kept as a list so duplicates can be reported instead of
// silently overwritten.
struct SymbolTableConfig {
    int bit_width = 6;
    std::vector<std::pair<std::string, std::string>> entries;
    uint32_t pad_index = 65;
    std::string pad_token;
};

// Reference alphabet: 64 words for indices 0..63, pad index 65 -> "的".
SymbolTableConfig reference_table_config();

// Immutable bidirectional index <-> token table.
class SymbolTable {
public:
    // Validates `cfg`; throws std::runtime_error on duplicate indices or
    // tokens, empty tokens, data indices outside [0, 2^bit_width - 1],
    // missing data indices, or a pad index inside the data range.
    static SymbolTable build(const SymbolTableConfig& cfg);

    int bit_width() const { return bit_width_; }
    uint32_t pad_index() const { return pad_index_; }
    const std::string& pad_token() const { return pad_token_; }

    // Data entries plus the pad entry.
    size_t size() const { return data_.size() + 1; }

    // nullptr if `index` has no entry.
    const std::string* token_for(uint32_t index) const;
    bool index_for(const std::string& token, uint32_t& index) const;

    // Distinct token lengths in bytes, longest first.
    const std::vector<size_t>& token_lengths() const { return lengths_; }

private:
    SymbolTable() = default;

    int bit_width_ = 0;
    uint32_t pad_index_ = 0;
    std::string pad_token_;
    std::vector<std::string> data_; // indexed by data index
    std::unordered_map<std::string, uint32_t> inverse_;
    std::vector<size_t> lengths_;
};

} // namespace wcodec
