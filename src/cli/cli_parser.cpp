#include "cli/cli_parser.hpp"

namespace wcodec {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    flags_.clear();
    positional_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (options_done || a.rfind("--", 0) != 0) {
            positional_.push_back(a);
            continue;
        }
        if (a == "--") {
            options_done = true;
            continue;
        }
        std::string key = a.substr(2);
        if (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                kv_[key] = next;
                flags_.erase(key);
                ++i;
                continue;
            }
        }
        kv_.erase(key);
        flags_.insert(key);
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end() || flags_.count(key) != 0;
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it != kv_.end()) return it->second;
    if (flags_.count(key) != 0) return "true";
    return def;
}

int CliParser::get_int(const std::string& key, int def) const {
    if (flags_.count(key) != 0) throw UsageError("cli: --" + key + " expects an integer");
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(it->second, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size()) {
        throw UsageError("cli: --" + key + " expects an integer, got '" + it->second + "'");
    }
    return v;
}

bool CliParser::flag(const std::string& key) const {
    return flags_.count(key) != 0;
}

} // namespace wcodec
