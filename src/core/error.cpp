#include "uploadguard/core/error.h"

namespace uploadguard::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kUnsupportedCategory:
            return "UNSUPPORTED_CATEGORY";
        case ErrorCode::kUnsupportedExtension:
            return "UNSUPPORTED_EXTENSION";
        case ErrorCode::kUnsupportedMimeType:
            return "UNSUPPORTED_MIME_TYPE";
        case ErrorCode::kUnsafeFilename:
            return "UNSAFE_FILENAME";
        case ErrorCode::kFileTooLarge:
            return "FILE_TOO_LARGE";
        case ErrorCode::kSignatureMismatch:
            return "SIGNATURE_MISMATCH";
        case ErrorCode::kMaliciousContent:
            return "MALICIOUS_CONTENT_DETECTED";
        case ErrorCode::kTooManyFiles:
            return "TOO_MANY_FILES";
        case ErrorCode::kUnexpectedField:
            return "UNEXPECTED_FIELD";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kStorageIo:
            return "STORAGE_IO_FAILURE";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

bool IsClientError(ErrorCode code) {
    switch (code) {
        case ErrorCode::kStorageIo:
        case ErrorCode::kInternal:
        case ErrorCode::kOk:
            return false;
        default:
            return true;
    }
}

}  // namespace uploadguard::core
