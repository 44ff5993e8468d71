#include "errors.hpp"

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidModel: return "invalid_model";
        case ErrorKind::BackendUnavailable: return "backend_unavailable";
        case ErrorKind::DecodeFailure: return "decode_failure";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::Internal: return "internal";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::BackendUnavailable || kind == ErrorKind::Busy;
}
