#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace wcodec {

enum class ErrorKind : uint8_t {
    Ok = 0,
    UndefinedSymbol,     // encode: computed index has no token
    SegmentationFailure, // decode: no token matches at `offset`
    UnknownSymbol,       // decode: matched token has no usable index
    InvalidEncoding,     // decode: reconstructed bytes are not UTF-8
    InvalidBitWidth,
};

const char* error_kind_name(ErrorKind kind);

// Result of a codec operation. On failure the operation's output
// argument is left empty.
struct CodecStatus {
    ErrorKind kind = ErrorKind::Ok;
    size_t offset = 0;   // byte offset (input for decode, output bytes for InvalidEncoding)
    size_t position = 0; // code point position, SegmentationFailure only
    std::string message;

    bool ok() const { return kind == ErrorKind::Ok; }

    static CodecStatus success() { return CodecStatus{}; }
    static CodecStatus failure(ErrorKind kind, size_t offset, std::string message) {
        CodecStatus s;
        s.kind = kind;
        s.offset = offset;
        s.message = std::move(message);
        return s;
    }
};

// "<kind>: <message>", for tool output.
std::string to_string(const CodecStatus& status);

} // namespace wcodec
