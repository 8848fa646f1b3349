#pragma once

#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
    Configuration,
    VcsUnavailable,
    NoChanges,
    TransientService,
    RequestRejected,
    Auth,
    Timeout,
    MalformedResponse,
    InvalidMessageFormat,
    Cancelled
};

// Base for every failure the pipeline reports. raw() carries the offending
// text (response body, model output) when there is one.
class CommitError : public std::runtime_error {
public:
    CommitError(ErrorKind kind, const std::string& message, std::string raw = "")
        : std::runtime_error(message), kind_(kind), raw_(std::move(raw)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& raw() const { return raw_; }

private:
    ErrorKind kind_;
    std::string raw_;
};

class ConfigurationError : public CommitError {
public:
    explicit ConfigurationError(const std::string& message)
        : CommitError(ErrorKind::Configuration, message) {}
};

class UnknownModelError : public ConfigurationError {
public:
    explicit UnknownModelError(const std::string& identifier)
        : ConfigurationError("Unknown model '" + identifier + "' (expected one of: default, advanced, advanced-fast)") {}
};

class VcsUnavailableError : public CommitError {
public:
    explicit VcsUnavailableError(const std::string& message)
        : CommitError(ErrorKind::VcsUnavailable, message) {}
};

class NoChangesError : public CommitError {
public:
    NoChangesError() : CommitError(ErrorKind::NoChanges, "No changes to summarize") {}
};

class TransientServiceError : public CommitError {
public:
    TransientServiceError(const std::string& message, long status)
        : CommitError(ErrorKind::TransientService, message), status_(status) {}

    // 0 when the last failure was a network error.
    long status() const { return status_; }

private:
    long status_;
};

class RequestRejectedError : public CommitError {
public:
    RequestRejectedError(const std::string& message, std::string raw = "")
        : CommitError(ErrorKind::RequestRejected, message, std::move(raw)) {}
};

class AuthError : public CommitError {
public:
    explicit AuthError(const std::string& message)
        : CommitError(ErrorKind::Auth, message) {}
};

class TimeoutError : public CommitError {
public:
    explicit TimeoutError(const std::string& message)
        : CommitError(ErrorKind::Timeout, message) {}
};

class MalformedResponseError : public CommitError {
public:
    MalformedResponseError(const std::string& message, std::string raw)
        : CommitError(ErrorKind::MalformedResponse, message, std::move(raw)) {}
};

class InvalidMessageFormatError : public CommitError {
public:
    InvalidMessageFormatError(const std::string& message, std::string raw)
        : CommitError(ErrorKind::InvalidMessageFormat, message, std::move(raw)) {}
};

class CancelledError : public CommitError {
public:
    CancelledError() : CommitError(ErrorKind::Cancelled, "Interrupted") {}
};

int exit_code_for(ErrorKind kind);
const char* error_kind_name(ErrorKind kind);
