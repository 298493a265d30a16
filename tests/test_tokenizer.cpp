#include "codec/tokenizer.hpp"

#include <gtest/gtest.h>

namespace wcodec {
namespace {

SymbolTable overlapping_table() {
    SymbolTableConfig cfg;
    cfg.bit_width = 2;
    cfg.entries = {{"0", "a"}, {"1", "ab"}, {"2", "b"}, {"3", "c"}};
    cfg.pad_index = 4;
    cfg.pad_token = "p";
    return SymbolTable::build(cfg);
}

TEST(TokenizerTest, PrefersLongestMatch) {
    SymbolTable t = overlapping_table();
    std::vector<TokenSpan> spans;
    CodecStatus st = segment_tokens(t, "abbpab", spans);
    ASSERT_TRUE(st.ok()) << to_string(st);
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[0].offset, 0u);
    EXPECT_EQ(spans[0].length, 2u);
    EXPECT_EQ(spans[1].offset, 2u);
    EXPECT_EQ(spans[2].offset, 3u);
    EXPECT_EQ(spans[3].offset, 4u);
    EXPECT_EQ(spans[3].length, 2u);
}

TEST(TokenizerTest, FallsBackToShorterToken) {
    SymbolTable t = overlapping_table();
    std::vector<TokenSpan> spans;
    ASSERT_TRUE(segment_tokens(t, "ac", spans).ok());
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].length, 1u);
}

TEST(TokenizerTest, EmptyInputSegmentsToNothing) {
    SymbolTable t = overlapping_table();
    std::vector<TokenSpan> spans(1, TokenSpan{0, 1});
    EXPECT_TRUE(segment_tokens(t, "", spans).ok());
    EXPECT_TRUE(spans.empty());
}

TEST(TokenizerTest, ReportsFailingOffset) {
    SymbolTable t = overlapping_table();
    std::vector<TokenSpan> spans;
    CodecStatus st = segment_tokens(t, "abcxab", spans);
    EXPECT_EQ(st.kind, ErrorKind::SegmentationFailure);
    EXPECT_EQ(st.offset, 3u);
    EXPECT_EQ(st.position, 3u);
    EXPECT_TRUE(spans.empty());
}

TEST(TokenizerTest, PositionCountsCodePoints) {
    SymbolTable t = SymbolTable::build(reference_table_config());
    std::vector<TokenSpan> spans;
    CodecStatus st = segment_tokens(t, "香蕉的X香蕉", spans);
    EXPECT_EQ(st.kind, ErrorKind::SegmentationFailure);
    EXPECT_EQ(st.offset, 9u);
    EXPECT_EQ(st.position, 3u);
}

} // namespace
} // namespace wcodec
