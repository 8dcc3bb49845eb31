// rootio – error type shared by every module
#pragma once

#include <stdexcept>
#include <string>

namespace rootio {

enum class ErrorCode {
    kNotFound,
    kInvalidDirectory,   // cyclic nesting or wrong stream mode
    kCorruptBlock,       // codec, size or checksum mismatch
    kCorruptBasket,
    kUnknownClass,
    kUnknownVersion,
    kIOError,
    kClosedHandle,
    kInvalidArgument,
    kCancelled,
};

const char* error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error("rootio: " + msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

[[noreturn]] void fail(ErrorCode code, const std::string& msg);

} // namespace rootio
