#include "cli/cli_parser.hpp"
#include "cli/tool_options.hpp"
#include "codec/word_codec.hpp"
#include "shell/banner.hpp"

#include <iostream>

static const char* kUsage =
    "Usage: wcodec_encode (--text <text> | --in <input.txt> | [--] <text>) [--out <output.txt>]\n"
    "                     [--table <table.txt>] [--bits <1..16>] [--banner]\n";

int main(int argc, char** argv) {
    try {
        wcodec::CliParser cli;
        cli.parse(argc, argv);
        std::string text;
        if (!wcodec::input_from_cli(cli, text)) {
            std::cout << kUsage;
            return 1;
        }
        auto codec = wcodec::codec_from_cli(cli);
        const int bits = wcodec::bit_width_from_cli(cli, *codec);

        std::string tokens;
        wcodec::CodecStatus st = codec->encode(text, bits, tokens);
        if (!st.ok()) {
            std::cerr << "[ERROR] " << wcodec::to_string(st) << "\n";
            return 2;
        }
        if (cli.flag("banner")) tokens = wcodec::wrap_banner(wcodec::default_banner(), tokens);
        wcodec::emit_output(cli, tokens);
        return 0;
    } catch (const wcodec::UsageError& e) {
        std::cout << e.what() << "\n" << kUsage;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
