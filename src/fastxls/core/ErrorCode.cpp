#include "fastxls/core/ErrorCode.hpp"

namespace fastxls {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                   return "Success";

        case ErrorCode::InvalidArgument:      return "Invalid argument";
        case ErrorCode::InternalError:        return "Internal error";
        case ErrorCode::InvalidState:         return "Invalid state";
        case ErrorCode::CapacityExceeded:     return "Capacity exceeded";

        case ErrorCode::FileNotFound:         return "File not found";
        case ErrorCode::FileAccessDenied:     return "File access denied";
        case ErrorCode::FileWriteError:       return "File write error";
        case ErrorCode::FileReadError:        return "File read error";

        case ErrorCode::InvalidWorksheet:     return "Invalid worksheet";
        case ErrorCode::InvalidFormat:        return "Invalid format";
        case ErrorCode::InvalidFormula:       return "Invalid formula";
        case ErrorCode::UnsupportedVersion:   return "Unsupported format version";

        case ErrorCode::SizeMismatch:         return "Record size mismatch";
    }
    return "Unknown error";
}

}} // namespace fastxls::core
