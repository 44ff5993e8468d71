#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    InvalidModel,
    BackendUnavailable,
    DecodeFailure,
    InvalidInput,
    NotFound,
    Busy,
    Internal,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Wire slug used in IPC responses, e.g. "invalid_model".
std::string_view to_string(ErrorKind kind);

// Transient failures the caller may resubmit. The daemon itself never retries.
bool is_retryable(ErrorKind kind);
