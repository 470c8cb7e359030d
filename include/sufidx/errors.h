#pragma once
#include <stdexcept>
#include <string>

namespace sufidx {

enum class ErrorCode {
    Ok = 0,
    IoError,
    InvalidFormat,
    InvalidArgs,
    OutOfRange,
    ReadOnly,
};

const char* error_code_name(ErrorCode code);

class IndexException : public std::runtime_error {
public:
    IndexException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace sufidx
