#pragma once

#include <memory>
#include <string>

#include "cli/cli_parser.hpp"
#include "codec/word_codec.hpp"

namespace wcodec {

// --table <file> or the reference table.
std::shared_ptr<const WordCodec> codec_from_cli(const CliParser& cli);

// --bits <n>, defaulting to the codec's own width. Throws UsageError.
int bit_width_from_cli(const CliParser& cli, const WordCodec& codec);

// --text <s>, the contents of --in <file>, or a single positional argument
// (use `-- <text>` for text starting with "--"). Returns false if none is
// given; throws UsageError on a bare --text/--in or competing sources.
bool input_from_cli(const CliParser& cli, std::string& text);

// Writes to --out (reporting the path on stdout) or prints to stdout.
void emit_output(const CliParser& cli, const std::string& text);

} // namespace wcodec
