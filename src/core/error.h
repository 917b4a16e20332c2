#pragma once

#include <string>
#include <utility>
#include <variant>

namespace kild {

enum class ErrorKind {
    NotFound,
    AlreadyExists,
    IdentityMismatch,
    SafetyCheckBlocked,
    PortAllocationExhausted,
    DaemonUnavailable,
    WorktreeConflict,
    IoFailure,
    InvalidInput,
    ConfigInvalid
};

struct Error {
    ErrorKind kind = ErrorKind::IoFailure;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    // Stable code for scripting, e.g. "SESSION_NOT_FOUND".
    const char* code() const;
    std::string describe() const;
};

// Process exit code the CLI layer reports for an error kind. 0 is reserved for success.
int exit_code_for(ErrorKind kind);
const char* error_kind_name(ErrorKind kind);

class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), ok_(false) {}

    static Status success() { return Status(); }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    const Error& error() const { return error_; }

private:
    Error error_;
    bool ok_ = true;
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    const Error& error() const { return std::get<Error>(data_); }

    Status status() const { return ok() ? Status() : Status(error()); }

private:
    std::variant<T, Error> data_;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error(kind, std::move(message));
}

}
