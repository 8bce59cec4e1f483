#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace filevault {

enum class ErrorCode {
    InvalidInput,
    DecryptionFailed,
    ConflictUnresolved,
    IoFailure,
    Cancelled
};

inline std::string_view ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::DecryptionFailed:
            return "DecryptionFailed";
        case ErrorCode::ConflictUnresolved:
            return "ConflictUnresolved";
        case ErrorCode::IoFailure:
            return "IoFailure";
        case ErrorCode::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace filevault
