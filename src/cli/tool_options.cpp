#include "cli/tool_options.hpp"

#include "io/table_loader.hpp"

#include <iostream>

namespace wcodec {

std::shared_ptr<const WordCodec> codec_from_cli(const CliParser& cli) {
    if (cli.flag("table")) throw UsageError("cli: --table expects a file name");
    const std::string table = cli.get("table");
    if (table.empty()) return WordCodec::create(reference_table_config());
    return WordCodec::create(load_table_config(table));
}

int bit_width_from_cli(const CliParser& cli, const WordCodec& codec) {
    return cli.get_int("bits", codec.bit_width());
}

bool input_from_cli(const CliParser& cli, std::string& text) {
    if (cli.flag("text")) throw UsageError("cli: --text expects a value");
    if (cli.flag("in")) throw UsageError("cli: --in expects a file name");

    const int sources = (cli.has("text") ? 1 : 0) + (cli.has("in") ? 1 : 0) +
                        (cli.positional().empty() ? 0 : 1);
    if (sources == 0) return false;
    if (sources > 1 || cli.positional().size() > 1) {
        throw UsageError("cli: give exactly one of --text, --in or a single text argument");
    }

    if (cli.has("text")) {
        text = cli.get("text");
    } else if (cli.has("in")) {
        text = read_text_file(cli.get("in"));
    } else {
        text = cli.positional().front();
    }
    return true;
}

void emit_output(const CliParser& cli, const std::string& text) {
    if (cli.flag("out")) throw UsageError("cli: --out expects a file name");
    const std::string out = cli.get("out");
    if (out.empty()) {
        std::cout << text << "\n";
        return;
    }
    write_text_file(out, text);
    std::cout << "Wrote: " << out << " (" << text.size() << " bytes)\n";
}

} // namespace wcodec
