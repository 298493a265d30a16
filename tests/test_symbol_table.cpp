#include "codec/symbol_table.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace wcodec {
namespace {

SymbolTableConfig two_bit_config() {
    SymbolTableConfig cfg;
    cfg.bit_width = 2;
    cfg.entries = {{"0", "a"}, {"1", "ab"}, {"2", "b"}, {"3", "c"}};
    cfg.pad_index = 4;
    cfg.pad_token = "p";
    return cfg;
}

TEST(SymbolTableTest, ReferenceTableIsComplete) {
    SymbolTable t = SymbolTable::build(reference_table_config());
    EXPECT_EQ(t.bit_width(), 6);
    EXPECT_EQ(t.size(), 65u);
    EXPECT_EQ(t.pad_index(), 65u);
    EXPECT_EQ(t.pad_token(), "的");
    ASSERT_NE(t.token_for(16), nullptr);
    EXPECT_EQ(*t.token_for(16), "香蕉");
    EXPECT_EQ(*t.token_for(65), "的");
    EXPECT_EQ(t.token_for(64), nullptr);

    uint32_t idx = 0;
    ASSERT_TRUE(t.index_for("红豆", idx));
    EXPECT_EQ(idx, 63u);
    EXPECT_FALSE(t.index_for("绿豆", idx));
}

TEST(SymbolTableTest, TokenLengthsAreDistinctAndDescending) {
    SymbolTable t = SymbolTable::build(two_bit_config());
    EXPECT_EQ(t.token_lengths(), (std::vector<size_t>{2, 1}));
}

TEST(SymbolTableTest, AcceptsMatchingPadEntryInMapping) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.entries.emplace_back("4", "p");
    EXPECT_NO_THROW(SymbolTable::build(cfg));
    cfg.entries.back().second = "q";
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsDuplicateIndex) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.entries.emplace_back("2", "z");
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsDuplicateToken) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.entries[3].second = "a";
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);

    cfg = two_bit_config();
    cfg.pad_token = "c";
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsMissingDataIndex) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.entries.pop_back();
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsOutOfRangeAndMalformedIndices) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.entries.emplace_back("5", "z");
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);

    cfg = two_bit_config();
    cfg.entries[0].first = "-0";
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);

    cfg = two_bit_config();
    cfg.entries[0].first = "";
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsBadPadAndEmptyTokens) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.pad_index = 3;
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);

    cfg = two_bit_config();
    cfg.pad_token.clear();
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);

    cfg = two_bit_config();
    cfg.entries[1].second.clear();
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

TEST(SymbolTableTest, RejectsBadBitWidth) {
    SymbolTableConfig cfg = two_bit_config();
    cfg.bit_width = 0;
    EXPECT_THROW(SymbolTable::build(cfg), std::runtime_error);
}

} // namespace
} // namespace wcodec
