#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wcodec {

// Bad or missing command-line input; tools answer it with usage text.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Very small CLI parser:
//   --key value
//   --flag (no value; get() reports "true")
//   --     ends option parsing
//   anything else is collected as a positional argument
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws UsageError if the value is not an integer.
    int get_int(const std::string& key, int def) const;
    // True only for an option given without a value.
    bool flag(const std::string& key) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::unordered_set<std::string> flags_;
    std::vector<std::string> positional_;
};

} // namespace wcodec
