#pragma once

#include <istream>
#include <string>

#include "codec/symbol_table.hpp"

namespace wcodec {

// Table file, UTF-8, one entry per line:
//   # comment
//   bits 6
//   0 香香
//   ...
//   pad 65 的
// Blank lines and '#' lines are skipped. Semantic checks are left to
// SymbolTable::build.
SymbolTableConfig load_table_config(const std::string& path);
SymbolTableConfig parse_table_config(std::istream& is, const std::string& source = "<stream>");

std::string read_text_file(const std::string& path);
void write_text_file(const std::string& path, const std::string& text);

} // namespace wcodec
