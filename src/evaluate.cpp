// Round-trip evaluator: encode -> decode -> size and fidelity report.
#include "cli/cli_parser.hpp"
#include "cli/tool_options.hpp"
#include "codec/word_codec.hpp"
#include "io/table_loader.hpp"
#include "text/utf8.hpp"

#include <cstdio>
#include <iostream>
#include <string>

static const char* kUsage =
    "Usage: wcodec_evaluate --in <input.txt> [--table <table.txt>] [--bits <1..16>]\n";

int main(int argc, char** argv) {
    try {
        wcodec::CliParser cli;
        cli.parse(argc, argv);
        if (cli.flag("in")) throw wcodec::UsageError("cli: --in expects a file name");
        const std::string in = cli.get("in");
        if (in.empty()) {
            std::cout << kUsage;
            return 1;
        }
        auto codec = wcodec::codec_from_cli(cli);
        const int bits = wcodec::bit_width_from_cli(cli, *codec);
        const std::string text = wcodec::read_text_file(in);

        std::string tokens;
        wcodec::CodecStatus st = codec->encode(text, bits, tokens);
        if (!st.ok()) {
            std::cerr << "[ERROR] encode: " << wcodec::to_string(st) << "\n";
            return 2;
        }
        std::string back;
        wcodec::DecodeStats stats;
        st = codec->decode(tokens, bits, back, &stats);
        if (!st.ok()) {
            std::cerr << "[ERROR] decode: " << wcodec::to_string(st) << "\n";
            return 2;
        }

        const double ratio = text.empty() ? 0.0 : static_cast<double>(tokens.size()) / static_cast<double>(text.size());
        std::cout << "input: " << text.size() << " bytes, "
                  << wcodec::utf8_position(text, text.size()) << " code points\n";
        std::cout << "encoded: " << tokens.size() << " bytes, " << stats.tokens << " tokens\n";
        std::printf("expansion: %.3f\n", ratio);
        std::cout << "zero bytes dropped: " << stats.zero_bytes_dropped << "\n";
        std::cout << "round trip: " << (back == text ? "lossless" : "lossy") << "\n";
        return 0;
    } catch (const wcodec::UsageError& e) {
        std::cout << e.what() << "\n" << kUsage;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
