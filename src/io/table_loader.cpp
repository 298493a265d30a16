#include "io/table_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wcodec {

namespace {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::runtime_error parse_error(const std::string& source, int line_no, const std::string& what) {
    return std::runtime_error("table: " + source + ":" + std::to_string(line_no) + ": " + what);
}

static int parse_int(const std::string& s, const std::string& source, int line_no) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 9) {
        throw parse_error(source, line_no, "expected a decimal number, got '" + s + "'");
    }
    return std::stoi(s);
}

} // namespace

SymbolTableConfig parse_table_config(std::istream& is, const std::string& source) {
    SymbolTableConfig cfg;
    bool have_pad = false;
    bool have_bits = false;
    std::string line;
    int line_no = 0;
    while (std::getline(is, line)) {
        ++line_no;
        if (line_no == 1 && line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3); // BOM
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream ls(line);
        std::string key, a, b, extra;
        ls >> key >> a;
        if (key == "bits") {
            if (a.empty() || (ls >> extra)) throw parse_error(source, line_no, "usage: bits <n>");
            if (have_bits) throw parse_error(source, line_no, "bits given twice");
            cfg.bit_width = parse_int(a, source, line_no);
            have_bits = true;
        } else if (key == "pad") {
            ls >> b;
            if (a.empty() || b.empty() || (ls >> extra)) {
                throw parse_error(source, line_no, "usage: pad <index> <token>");
            }
            if (have_pad) throw parse_error(source, line_no, "pad entry given twice");
            cfg.pad_index = static_cast<uint32_t>(parse_int(a, source, line_no));
            cfg.pad_token = b;
            have_pad = true;
        } else {
            if (a.empty() || (ls >> extra)) throw parse_error(source, line_no, "usage: <index> <token>");
            cfg.entries.emplace_back(key, a);
        }
    }
    if (!have_pad) throw std::runtime_error("table: " + source + ": missing pad entry");
    return cfg;
}

SymbolTableConfig load_table_config(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    return parse_table_config(ifs, path);
}

std::string read_text_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
}

} // namespace wcodec
