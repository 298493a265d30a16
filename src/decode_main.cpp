#include "cli/cli_parser.hpp"
#include "cli/tool_options.hpp"
#include "codec/word_codec.hpp"
#include "shell/banner.hpp"

#include <iostream>

static const char* kUsage =
    "Usage: wcodec_decode (--text <tokens> | --in <input.txt> | <tokens>) [--out <output.txt>]\n"
    "                     [--table <table.txt>] [--bits <1..16>]\n";

// Files usually end with a newline that is not part of the ciphertext.
static std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

int main(int argc, char** argv) {
    try {
        wcodec::CliParser cli;
        cli.parse(argc, argv);
        std::string input;
        if (!wcodec::input_from_cli(cli, input)) {
            std::cout << kUsage;
            return 1;
        }
        auto codec = wcodec::codec_from_cli(cli);
        const int bits = wcodec::bit_width_from_cli(cli, *codec);

        const std::string tokens = wcodec::strip_banner(wcodec::default_banner(), chomp(input));
        std::string text;
        wcodec::CodecStatus st = codec->decode(tokens, bits, text);
        if (!st.ok()) {
            std::cerr << "[ERROR] " << wcodec::to_string(st) << "\n";
            return 2;
        }
        wcodec::emit_output(cli, text);
        return 0;
    } catch (const wcodec::UsageError& e) {
        std::cout << e.what() << "\n" << kUsage;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
