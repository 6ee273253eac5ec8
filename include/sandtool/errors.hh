#pragma once

#include <cstdint>

namespace sandtool {

// Category of a failed request, shared by all result types
enum class ErrorKind : uint8_t {
    ValidationError,
    SyntaxError,
    TimeoutError,
    ResourceExceeded,
    RuntimeFailure,
    InternalError,
};

constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::ValidationError: return "ValidationError";
    case ErrorKind::SyntaxError: return "SyntaxError";
    case ErrorKind::TimeoutError: return "TimeoutError";
    case ErrorKind::ResourceExceeded: return "ResourceExceeded";
    case ErrorKind::RuntimeFailure: return "RuntimeFailure";
    case ErrorKind::InternalError: return "InternalError";
    }
    return "unknown";
}

} // namespace sandtool
