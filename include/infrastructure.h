#pragma once
#include <string>
#include <utility>

// Outcome of a persistence or I/O operation that should not throw through the
// download loop. On failure value is default-constructed and message explains why.
template <typename T>
struct Result {
    bool success = false;
    T value{};
    std::string message;

    static Result<T> Success(T value, const std::string& message = "") {
        return Result<T>(true, std::move(value), message);
    }

    static Result<T> Failure(const std::string& message) {
        return Result<T>(false, T{}, message);
    }

    Result(bool success, T value, const std::string& message)
        : success(success), value(std::move(value)), message(message)
    {
    }

    Result() = default;

    const T& valueOr(const T& fallback) const {
        return success ? value : fallback;
    }
};
