#pragma once

#include <string>

namespace uploadguard::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kUnsupportedCategory,
    kUnsupportedExtension,
    kUnsupportedMimeType,
    kUnsafeFilename,
    kFileTooLarge,
    kSignatureMismatch,
    kMaliciousContent,
    kTooManyFiles,
    kUnexpectedField,
    kInvalidArgument,
    kNotFound,
    kStorageIo,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case identifier used in JSON error envelopes and metrics labels.
const char* ErrorCodeName(ErrorCode code);

/// @brief True for failures caused by the uploaded file or request itself.
bool IsClientError(ErrorCode code);

}  // namespace uploadguard::core
