// include/storage_error/result.h
#pragma once

#include "storage_error.h"

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace elastic {

/**
 * @brief Either a value of T or the StorageError explaining why there is none.
 *
 * Accessing the wrong alternative throws std::runtime_error; callers are
 * expected to test isOk() first.
 */
template<typename T>
class Result {
public:
    Result(T val) : state_(std::in_place_index<0>, std::move(val)) {}
    Result(StorageError err) : state_(std::in_place_index<1>, std::move(err)) {}

    bool hasValue() const { return state_.index() == 0; }
    bool hasError() const { return state_.index() == 1; }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& { return std::get<0>(checkedValue()); }
    T& value() & { return std::get<0>(checkedValue()); }
    T&& value() && { return std::get<0>(std::move(checkedValue())); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    const StorageError& error() const& { return std::get<1>(checkedError()); }
    StorageError& error() & { return std::get<1>(checkedError()); }
    StorageError&& error() && { return std::get<1>(std::move(checkedError())); }

private:
    std::variant<T, StorageError> state_;

    std::variant<T, StorageError>& checkedValue() {
        if (!hasValue()) throw std::runtime_error("Result holds an error, not a value");
        return state_;
    }
    const std::variant<T, StorageError>& checkedValue() const {
        if (!hasValue()) throw std::runtime_error("Result holds an error, not a value");
        return state_;
    }
    std::variant<T, StorageError>& checkedError() {
        if (!hasError()) throw std::runtime_error("Result holds a value, not an error");
        return state_;
    }
    const std::variant<T, StorageError>& checkedError() const {
        if (!hasError()) throw std::runtime_error("Result holds a value, not an error");
        return state_;
    }
};

// Success carries nothing; failure carries the error.
template<>
class Result<void> {
public:
    Result() = default;
    Result(StorageError err) : error_(std::in_place, std::move(err)) {}

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& { return *checkedError(); }
    StorageError& error() & { return *checkedError(); }
    StorageError&& error() && { return std::move(*checkedError()); }

private:
    std::optional<StorageError> error_;

    std::optional<StorageError>& checkedError() {
        if (!hasError()) throw std::runtime_error("Status is OK and holds no error");
        return error_;
    }
    const std::optional<StorageError>& checkedError() const {
        if (!hasError()) throw std::runtime_error("Status is OK and holds no error");
        return error_;
    }
};

using Status = Result<void>;

} // namespace elastic
