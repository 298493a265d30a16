#include "codec/symbol_table.hpp"

#include <string>

namespace wcodec {

namespace {

const char* const kReferenceWords[64] = {
    "香香", "软软", "甜甜", "糯糯", "蜂蜜", "奶油", "腻腻", "酥酥",
    "脆脆", "滑滑", "嫩嫩", "番茄炒可乐", "番茄炒科比", "草莓", "蓝莓", "苹果",
    "香蕉", "葡萄", "酸酸", "辣辣", "爽爽", "咸咸", "鲜鲜", "苦苦",
    "甘甘", "绵绵", "弹弹", "润润", "油油", "清清", "浓浓", "醇醇",
    "淡淡", "幽幽", "热热乎乎", "冰冰凉凉", "黏黏", "糊糊", "麻麻", "橙子",
    "西瓜", "樱桃", "菠萝", "猕猴桃", "桃子", "梨", "杏", "李子",
    "西红柿", "黄瓜", "胡萝卜", "生菜", "菠菜", "花椰菜", "卷心菜", "洋葱",
    "大蒜", "土豆", "红薯", "南瓜", "玉米", "豌豆", "扁豆", "红豆",
};

} // namespace

SymbolTableConfig reference_table_config() {
    SymbolTableConfig cfg;
    cfg.bit_width = 6;
    cfg.entries.reserve(64);
    for (int i = 0; i < 64; ++i) {
        cfg.entries.emplace_back(std::to_string(i), kReferenceWords[i]);
    }
    // Index 64 is deliberately left unused.
    cfg.pad_index = 65;
    cfg.pad_token = "的";
    return cfg;
}

} // namespace wcodec
