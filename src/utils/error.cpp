#include "blast/error.hpp"
#include <sstream>

namespace blast {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotSupported: return "Not supported";

        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::PermissionDenied: return "Permission denied";

        case ErrorCode::SizeLimitExceeded: return "Size limit exceeded";
        case ErrorCode::HashNotFound: return "Hash not found";
        case ErrorCode::KeyNotFound: return "Key not found";
        case ErrorCode::Corrupted: return "Cache entry corrupted";
        case ErrorCode::CompressionFailed: return "Compression failed";
        case ErrorCode::DecompressionFailed: return "Decompression failed";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

Error Error::with_context(const std::string& context) const {
    if (details_.empty()) {
        return Error(code_, context, message_);
    }
    return Error(code_, context, message_ + ": " + details_);
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace blast
