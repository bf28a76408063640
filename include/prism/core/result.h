// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace prism::core {

// Error class - a recoverable failure with the location that raised it
class Error {
public:
    std::string Message;
    std::source_location Location;

    Error(std::string message,
          std::source_location location = std::source_location::current())
        : Message(std::move(message)), Location(location) {}

    const char* What() const noexcept { return Message.c_str(); }

    // Prefix the message with what was being attempted
    Error WithContext(const std::string& context) const {
        return Error(context + ": " + Message, Location);
    }
};

inline Error MakeError(const std::string& message,
                       std::source_location location = std::source_location::current()) {
    return Error(message, location);
}

// Result<T> - either a value or an Error
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message,
                      std::source_location location = std::source_location::current()) {
        return Result(MakeError(message, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<T>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access value (throws if error)
    T& Value() & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    T&& Value() && {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    const T& Value() const & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    // Access error (undefined if ok)
    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

// Specialization for Result<void>
template<>
class Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() : data_(std::monostate{}) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result Ok() { return Result(); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message,
                      std::source_location location = std::source_location::current()) {
        return Result(MakeError(message, location));
    }

    bool IsOk() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

// ENSURE - return an error from the enclosing Result-returning function
#define ENSURE(cond, msg) \
    if (!(cond)) { \
        return ::prism::core::MakeError(msg); \
    }

} // namespace prism::core
