#pragma once
#ifndef AEGIS_ERRORS_H
#define AEGIS_ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

namespace aegis {

class GovernanceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ValidationReason {
    InvalidDimension,
    DimensionMismatch,
    InvalidBasis,
    MalformedRecord,
    InvalidArgument,
};

const char* to_string(ValidationReason reason);

// Bad input. Never retried internally.
class ValidationError : public GovernanceError {
public:
    ValidationError(ValidationReason reason, const std::string& message);
    ValidationReason reason() const { return reason_; }

private:
    ValidationReason reason_;
};

// Fingerprint mismatch on reconstruction: corrupted or tampered data.
class IntegrityError : public GovernanceError {
public:
    using GovernanceError::GovernanceError;
};

// Control-flow signals from admission. retry_after() is advisory, in seconds.
class RateLimitExceeded : public GovernanceError {
public:
    RateLimitExceeded(const std::string& operation, const std::string& identity, int retry_after);
    int retry_after() const { return retry_after_; }
    const std::string& operation() const { return operation_; }
    const std::string& identity() const { return identity_; }

private:
    std::string operation_;
    std::string identity_;
    int retry_after_;
};

class CircuitOpenError : public GovernanceError {
public:
    CircuitOpenError(const std::string& operation, const std::string& identity, int retry_after);
    int retry_after() const { return retry_after_; }
    const std::string& operation() const { return operation_; }
    const std::string& identity() const { return identity_; }

private:
    std::string operation_;
    std::string identity_;
    int retry_after_;
};

// Wraps the failure of governed work after admission bookkeeping is done.
class OperationFailed : public GovernanceError {
public:
    OperationFailed(const std::string& operation, const std::string& reason, std::exception_ptr cause);
    const std::string& operation() const { return operation_; }
    std::exception_ptr cause() const { return cause_; }
    [[noreturn]] void rethrow_cause() const;

private:
    std::string operation_;
    std::exception_ptr cause_;
};

}  // namespace aegis

#endif  // AEGIS_ERRORS_H
