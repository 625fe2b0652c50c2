#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace surge {

enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidData,
    InvalidState,
    NotFound,
    FileNotFound,
    Conflict,
    Timeout,
    OperationCancelled,
    DatabaseError,
    InternalError,
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::Timeout: return "Timed out";
        case ErrorCode::OperationCancelled: return "Cancelled";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * @brief Value or Error
 *
 * value() on an error and error() on a value throw std::logic_error; callers
 * test has_value() (or the bool conversion) first.
 */
template <typename T> class Result {
public:
    Result(T&& value) : state_(std::move(value)) {}
    Result(const T& value) : state_(value) {}
    Result(Error error) : state_(std::move(error)) {}
    Result(ErrorCode code) : state_(Error{code}) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        requireValue();
        return std::get<0>(state_);
    }
    T&& value() && {
        requireValue();
        return std::get<0>(std::move(state_));
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("error() called on a successful Result");
        return std::get<1>(state_);
    }

private:
    void requireValue() const {
        if (!has_value())
            throw std::logic_error("value() called on failed Result: " +
                                   std::get<1>(state_).message);
    }

    std::variant<T, Error> state_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(Error{code}) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            throw std::logic_error("value() called on failed Result: " + error_.message);
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("error() called on a successful Result");
        return error_;
    }

private:
    Error error_;
};

// Wall-clock milliseconds since the unix epoch; every persisted timestamp uses this unit.
inline int64_t epochMillis(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace surge
