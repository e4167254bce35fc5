#include "status.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "ok";
    case ErrorKind::DeviceNotFound: return "device not found";
    case ErrorKind::DeviceOpenFailure: return "device open failure";
    case ErrorKind::ConfigurationError: return "configuration error";
    case ErrorKind::ServiceFailure: return "service failure";
    case ErrorKind::IoError: return "i/o error";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

std::string Status::to_string() const {
    if (is_ok()) return "ok";
    if (message_.empty()) return error_kind_name(kind_);
    return std::string(error_kind_name(kind_)) + ": " + message_;
}
