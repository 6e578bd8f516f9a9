#pragma once

#include <optional>
#include <string>
#include <utility>

#include "uploadguard/core/error.h"

namespace uploadguard::core {

/// @brief Value-or-error return type; modules report failures through it instead of throwing.
template <typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const Error& error) : value_(std::nullopt), error_(error) {}
    Result(ErrorCode code, std::string message)
        : value_(std::nullopt), error_{code, std::move(message)} {}

    bool ok() const { return value_.has_value(); }
    const T& value() const { return value_.value(); }
    T& value() { return value_.value(); }
    /// @brief Moves the value out; used for move-only payloads such as handles.
    T TakeValue() { return std::move(value_.value()); }
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    std::optional<T> value_;
    Error error_{ErrorCode::kOk, ""};
};

template <>
class Result<void> {
public:
    Result() : ok_(true) {}
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(ErrorCode code, std::string message) : ok_(false), error_{code, std::move(message)} {}

    bool ok() const { return ok_; }
    void value() const {}
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    bool ok_{false};
    Error error_{ErrorCode::kOk, ""};
};

/// @brief Convenience helper for a successful empty result.
inline Result<void> Ok() { return Result<void>(); }

}  // namespace uploadguard::core
