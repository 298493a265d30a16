#include "io/table_loader.hpp"

#include "codec/word_codec.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace wcodec {
namespace {

TEST(TableLoaderTest, ParsesEntriesPadAndWidth) {
    std::istringstream is(
        "# tiny table\n"
        "bits 2\n"
        "\n"
        "0 a\n"
        "1 ab\r\n"
        "2 b\n"
        "  3   c  \n"
        "pad 4 p\n");
    SymbolTableConfig cfg = parse_table_config(is);
    EXPECT_EQ(cfg.bit_width, 2);
    ASSERT_EQ(cfg.entries.size(), 4u);
    EXPECT_EQ(cfg.entries[1].first, "1");
    EXPECT_EQ(cfg.entries[1].second, "ab");
    EXPECT_EQ(cfg.entries[3].second, "c");
    EXPECT_EQ(cfg.pad_index, 4u);
    EXPECT_EQ(cfg.pad_token, "p");
    EXPECT_NO_THROW(SymbolTable::build(cfg));
}

TEST(TableLoaderTest, SkipsByteOrderMark) {
    std::istringstream is("\xEF\xBB\xBF" "bits 1\n0 x\n1 y\npad 2 z\n");
    SymbolTableConfig cfg = parse_table_config(is);
    EXPECT_EQ(cfg.bit_width, 1);
    EXPECT_EQ(cfg.entries.size(), 2u);
}

TEST(TableLoaderTest, RequiresPadEntry) {
    std::istringstream is("bits 1\n0 x\n1 y\n");
    EXPECT_THROW(parse_table_config(is), std::runtime_error);
}

TEST(TableLoaderTest, RejectsMalformedLines) {
    std::istringstream extra("0 x y\npad 2 z\n");
    EXPECT_THROW(parse_table_config(extra), std::runtime_error);

    std::istringstream missing("0\npad 2 z\n");
    EXPECT_THROW(parse_table_config(missing), std::runtime_error);

    std::istringstream bad_bits("bits six\npad 2 z\n");
    EXPECT_THROW(parse_table_config(bad_bits), std::runtime_error);

    std::istringstream twice("pad 2 z\npad 3 w\n");
    EXPECT_THROW(parse_table_config(twice), std::runtime_error);

    std::istringstream bits_twice("bits 1\nbits 2\n0 x\n1 y\npad 4 z\n");
    EXPECT_THROW(parse_table_config(bits_twice), std::runtime_error);
}

TEST(TableLoaderTest, ErrorNamesSourceAndLine) {
    std::istringstream is("bits 1\n0 x y\n");
    try {
        parse_table_config(is, "mem.txt");
        FAIL() << "expected parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("mem.txt:2"), std::string::npos);
    }
}

TEST(TableLoaderTest, ShippedTableMatchesReference) {
    SymbolTableConfig cfg = load_table_config(WCODEC_DATA_DIR "/reference_table.txt");
    auto from_file = WordCodec::create(cfg);
    auto builtin = WordCodec::create(reference_table_config());

    std::string a, b;
    ASSERT_TRUE(from_file->encode("Hello, 世界", a).ok());
    ASSERT_TRUE(builtin->encode("Hello, 世界", b).ok());
    EXPECT_EQ(a, b);
    EXPECT_EQ(from_file->table().size(), builtin->table().size());
}

TEST(TableLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_table_config(WCODEC_DATA_DIR "/does_not_exist.txt"), std::runtime_error);
    EXPECT_THROW(read_text_file(WCODEC_DATA_DIR "/does_not_exist.txt"), std::runtime_error);
}

} // namespace
} // namespace wcodec
