#include "codec/symbol_table.hpp"

#include "bits/bitstream.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>

namespace wcodec {

namespace {

static uint32_t parse_index(const std::string& s) {
    if (s.empty() || s.size() > 10) throw std::runtime_error("symbol table: invalid index '" + s + "'");
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') throw std::runtime_error("symbol table: invalid index '" + s + "'");
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("symbol table: index out of range '" + s + "'");
    }
    return static_cast<uint32_t>(v);
}

} // namespace

SymbolTable SymbolTable::build(const SymbolTableConfig& cfg) {
    if (!valid_bit_width(cfg.bit_width)) {
        throw std::runtime_error("symbol table: bit width must be in [" + std::to_string(kMinBitWidth) +
                                 ", " + std::to_string(kMaxBitWidth) + "]");
    }
    const uint32_t data_count = 1u << cfg.bit_width;
    if (cfg.pad_index < data_count) {
        throw std::runtime_error("symbol table: pad index " + std::to_string(cfg.pad_index) +
                                 " lies inside the data range");
    }
    if (cfg.pad_token.empty()) throw std::runtime_error("symbol table: missing pad token");

    SymbolTable t;
    t.bit_width_ = cfg.bit_width;
    t.pad_index_ = cfg.pad_index;
    t.pad_token_ = cfg.pad_token;
    t.data_.assign(data_count, std::string());

    for (const auto& kv : cfg.entries) {
        const uint32_t idx = parse_index(kv.first);
        const std::string& tok = kv.second;
        if (idx == cfg.pad_index) {
            // A pad entry repeated in the mapping is tolerated when it agrees.
            if (tok != cfg.pad_token) {
                throw std::runtime_error("symbol table: conflicting token for pad index " + kv.first);
            }
            continue;
        }
        if (idx >= data_count) {
            throw std::runtime_error("symbol table: index " + kv.first + " exceeds " +
                                     std::to_string(cfg.bit_width) + "-bit range");
        }
        if (tok.empty()) throw std::runtime_error("symbol table: empty token for index " + kv.first);
        if (!t.data_[idx].empty()) throw std::runtime_error("symbol table: duplicate index " + kv.first);
        t.data_[idx] = tok;
    }

    for (uint32_t i = 0; i < data_count; ++i) {
        if (t.data_[i].empty()) {
            throw std::runtime_error("symbol table: missing token for index " + std::to_string(i));
        }
        if (!t.inverse_.emplace(t.data_[i], i).second) {
            throw std::runtime_error("symbol table: duplicate token '" + t.data_[i] + "'");
        }
    }
    if (!t.inverse_.emplace(t.pad_token_, t.pad_index_).second) {
        throw std::runtime_error("symbol table: pad token '" + t.pad_token_ + "' is also a data token");
    }

    for (const auto& kv : t.inverse_) t.lengths_.push_back(kv.first.size());
    std::sort(t.lengths_.begin(), t.lengths_.end(), std::greater<size_t>());
    t.lengths_.erase(std::unique(t.lengths_.begin(), t.lengths_.end()), t.lengths_.end());
    return t;
}

const std::string* SymbolTable::token_for(uint32_t index) const {
    if (index == pad_index_) return &pad_token_;
    if (index < data_.size()) return &data_[index];
    return nullptr;
}

bool SymbolTable::index_for(const std::string& token, uint32_t& index) const {
    auto it = inverse_.find(token);
    if (it == inverse_.end()) return false;
    index = it->second;
    return true;
}

} // namespace wcodec
