#include "errors.hpp"

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:
            return 2;
        case ErrorKind::NoChanges:
            return 3;
        case ErrorKind::VcsUnavailable:
            return 4;
        case ErrorKind::TransientService:
        case ErrorKind::RequestRejected:
        case ErrorKind::Auth:
        case ErrorKind::Timeout:
        case ErrorKind::MalformedResponse:
            return 5;
        case ErrorKind::InvalidMessageFormat:
            return 6;
        case ErrorKind::Cancelled:
            return 130;
    }
    return 1;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::VcsUnavailable: return "version control unavailable";
        case ErrorKind::NoChanges: return "no changes";
        case ErrorKind::TransientService: return "service unavailable";
        case ErrorKind::RequestRejected: return "request rejected";
        case ErrorKind::Auth: return "authentication failed";
        case ErrorKind::Timeout: return "timed out";
        case ErrorKind::MalformedResponse: return "malformed response";
        case ErrorKind::InvalidMessageFormat: return "invalid commit message";
        case ErrorKind::Cancelled: return "interrupted";
    }
    return "error";
}
