//include/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <utility>

namespace storage {

/**
 * @brief Result type that can contain either a value or an error
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    // Reading the value of a failed result rethrows its error.
    const T& value() const& {
        if (!hasValue()) throw missingValue();
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw missingValue();
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw missingValue();
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    T&& operator*() && { return std::move(value()); }

    const StorageError& error() const& {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result has no error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result has no error");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result has no error");
        return std::move(*error_);
    }

    T valueOr(T default_value) const& {
        return hasValue() ? *value_ : std::move(default_value);
    }
    T valueOr(T default_value) && {
        return hasValue() ? std::move(*value_) : std::move(default_value);
    }

    // Map: if Ok, applies func to value; if Error, propagates error
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        if (hasValue()) {
            return Result<decltype(func(*value_))>(func(*value_));
        }
        return Result<decltype(func(*value_))>(*error_);
    }
    template<typename F>
    auto map(F&& func) && -> Result<decltype(func(std::declval<T&&>()))> {
        if (hasValue()) {
            return Result<decltype(func(std::move(*value_)))>(func(std::move(*value_)));
        }
        return Result<decltype(func(std::move(*value_)))>(std::move(*error_));
    }

    template<typename F>
    Result<T> mapError(F&& func) && {
        if (hasError()) {
            return Result<T>(func(std::move(*error_)));
        }
        return std::move(*this);
    }

private:
    StorageError missingValue() const {
        return error_ ? *error_ : StorageError(ErrorCode::INTERNAL_ERROR, "Result has no value");
    }
};

// Specialization for void
template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default; // Represents success
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result<void> has no error");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result<void> has no error");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw StorageError(ErrorCode::INTERNAL_ERROR, "Result<void> has no error");
        return std::move(*error_);
    }

    template<typename F>
    Result<void> mapError(F&& func) && {
        if (hasError()) {
            return Result<void>(func(std::move(*error_)));
        }
        return std::move(*this);
    }
};

// Operations that don't return a value but can fail
using Status = Result<void>;

inline Status OkStatus() { return Status(); }

} // namespace storage
