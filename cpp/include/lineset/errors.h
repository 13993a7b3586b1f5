#pragma once
#include <stdexcept>
#include <string>

namespace lineset {

enum class ErrorCode {
    Ok = 0,
    IoError,
    EmptyEntry,
    AlreadyExists,
    NotFound,
    InvalidArgs,
};

inline const char* to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:            return "ok";
        case ErrorCode::IoError:       return "io_error";
        case ErrorCode::EmptyEntry:    return "empty_entry";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::NotFound:      return "not_found";
        case ErrorCode::InvalidArgs:   return "invalid_args";
    }
    return "unknown";
}

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace lineset
