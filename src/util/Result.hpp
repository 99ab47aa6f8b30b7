#pragma once
// Result.hpp - Value-or-error return type
// Used everywhere a user action can fail without it being exceptional

#include <string>
#include <utility>
#include <variant>

namespace lrc {

enum class ErrorCode {
    Unknown,
    NotFound,          // file does not exist
    UnsupportedFormat, // audio extension not recognised
    EmptyFile,         // lyric file has no usable lines
    NotReady,          // audio and lyrics must both be loaded
    AlreadyComplete,   // every line already has a timestamp (informational)
    IoError,
    ParseError,
    AudioDevice
};

struct Error {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{ErrorCode::Unknown, std::move(message)});
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::get<T>(std::move(data_));
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return Result(Error{ErrorCode::Unknown, std::move(message)});
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return ok_;
    }
    bool isErr() const {
        return !ok_;
    }
    explicit operator bool() const {
        return ok_;
    }

    const Error& error() const {
        return error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : ok_(false), error_(std::move(error)) {}

    bool ok_{true};
    Error error_;
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::UnsupportedFormat:
        return "UnsupportedFormat";
    case ErrorCode::EmptyFile:
        return "EmptyFile";
    case ErrorCode::NotReady:
        return "NotReady";
    case ErrorCode::AlreadyComplete:
        return "AlreadyComplete";
    case ErrorCode::IoError:
        return "IoError";
    case ErrorCode::ParseError:
        return "ParseError";
    case ErrorCode::AudioDevice:
        return "AudioDevice";
    case ErrorCode::Unknown:
        break;
    }
    return "Unknown";
}

} // namespace lrc
