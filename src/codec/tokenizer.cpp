#include "codec/tokenizer.hpp"

#include "text/utf8.hpp"

namespace wcodec {

CodecStatus segment_tokens(const SymbolTable& table,
                           const std::string& text,
                           std::vector<TokenSpan>& spans) {
    spans.clear();
    const std::vector<size_t>& lengths = table.token_lengths();
    std::string probe;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t left = text.size() - pos;
        bool matched = false;
        for (size_t len : lengths) {
            if (len > left) continue;
            probe.assign(text, pos, len);
            uint32_t idx = 0;
            if (table.index_for(probe, idx)) {
                spans.push_back({pos, len});
                pos += len;
                matched = true;
                break;
            }
        }
        if (!matched) {
            spans.clear();
            const size_t position = utf8_position(text, pos);
            CodecStatus st = CodecStatus::failure(
                ErrorKind::SegmentationFailure, pos,
                "no token matches at position " + std::to_string(position));
            st.position = position;
            return st;
        }
    }
    return CodecStatus::success();
}

} // namespace wcodec
