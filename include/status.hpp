#pragma once

#include <string>
#include <utility>

enum class ErrorKind {
    None,
    DeviceNotFound,
    DeviceOpenFailure,
    ConfigurationError,
    ServiceFailure,
    IoError,
    Cancelled,
    InvalidArgument,
};

const char* error_kind_name(ErrorKind kind);

// Result of an orchestration-level operation. Components return it; main()
// is the one place that logs a failure.
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }
    static Status error(ErrorKind kind, std::string message) {
        return Status(kind, std::move(message));
    }

    bool is_ok() const { return kind_ == ErrorKind::None; }
    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    std::string to_string() const;

private:
    Status(ErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    ErrorKind kind_ = ErrorKind::None;
    std::string message_;
};
