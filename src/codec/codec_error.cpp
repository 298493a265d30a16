#include "codec/codec_error.hpp"

namespace wcodec {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Ok: return "ok";
    case ErrorKind::UndefinedSymbol: return "undefined symbol";
    case ErrorKind::SegmentationFailure: return "segmentation failure";
    case ErrorKind::UnknownSymbol: return "unknown symbol";
    case ErrorKind::InvalidEncoding: return "invalid encoding";
    case ErrorKind::InvalidBitWidth: return "invalid bit width";
    }
    return "unknown error";
}

std::string to_string(const CodecStatus& status) {
    if (status.ok()) return error_kind_name(status.kind);
    return std::string(error_kind_name(status.kind)) + ": " + status.message;
}

} // namespace wcodec
