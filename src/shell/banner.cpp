#include "shell/banner.hpp"

namespace wcodec {

Banner default_banner() {
    return Banner{"啊啊啊啊啊啊宝宝你是一个", "的小蛋糕"};
}

std::string wrap_banner(const Banner& b, const std::string& tokens) {
    return b.prefix + tokens + b.suffix;
}

std::string strip_banner(const Banner& b, const std::string& text) {
    const size_t framed = b.prefix.size() + b.suffix.size();
    if (text.size() < framed) return text;
    if (text.compare(0, b.prefix.size(), b.prefix) != 0) return text;
    if (text.compare(text.size() - b.suffix.size(), b.suffix.size(), b.suffix) != 0) return text;
    return text.substr(b.prefix.size(), text.size() - framed);
}

} // namespace wcodec
