#pragma once

#include <optional>
#include <string>
#include <utility>

namespace diagram_model {

enum class ErrorCode {
    None,
    MalformedXml,
    MalformedCompression,
    MalformedStyle,
    DuplicateId,
    UnresolvableReference,
    InvariantViolation,
    NothingToUndo,
    NothingToRedo,
    ReentrantMutation,
    Io,
};

const char* to_string(ErrorCode code);

// Decode failures are grouped as format errors.
bool is_format_error(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::string path;     // node path, e.g. "mxfile/diagram[2]/mxGraphModel/root/mxCell[4]"
    std::string fragment; // raw source excerpt, possibly truncated
};

std::string describe(const Error& error);

class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return error_.code == ErrorCode::None; }
    explicit operator bool() const { return ok(); }
    ErrorCode code() const { return error_.code; }
    const Error& error() const { return error_; }

private:
    Error error_;
};

inline Status make_error(ErrorCode code, std::string message, std::string path = {}, std::string fragment = {}) {
    return Status(Error{ code, std::move(message), std::move(path), std::move(fragment) });
}

template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}
    Result(const Status& status) : error_(status.error()) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }
    T& operator*() { return *value_; }
    const T& operator*() const { return *value_; }

    ErrorCode code() const { return ok() ? ErrorCode::None : error_.code; }
    const Error& error() const { return error_; }
    Status status() const { return ok() ? Status() : Status(error_); }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace diagram_model
