#pragma once

#include <string>

namespace wcodec {

// Decorative frame the web form put around ciphertext.
struct Banner {
    std::string prefix;
    std::string suffix;
};

Banner default_banner();

std::string wrap_banner(const Banner& b, const std::string& tokens);

// Removes the frame only when both prefix and suffix are present;
// otherwise returns `text` unchanged.
std::string strip_banner(const Banner& b, const std::string& text);

} // namespace wcodec
