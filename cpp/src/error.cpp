// rootio – error helpers

#include "rootio/error.hpp"

namespace rootio {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNotFound:         return "NotFound";
        case ErrorCode::kInvalidDirectory: return "InvalidDirectory";
        case ErrorCode::kCorruptBlock:     return "CorruptBlock";
        case ErrorCode::kCorruptBasket:    return "CorruptBasket";
        case ErrorCode::kUnknownClass:     return "UnknownClass";
        case ErrorCode::kUnknownVersion:   return "UnknownVersion";
        case ErrorCode::kIOError:          return "IOError";
        case ErrorCode::kClosedHandle:     return "ClosedHandle";
        case ErrorCode::kInvalidArgument:  return "InvalidArgument";
        case ErrorCode::kCancelled:        return "Cancelled";
    }
    return "?";
}

void fail(ErrorCode code, const std::string& msg) {
    throw Error(code, msg);
}

} // namespace rootio
