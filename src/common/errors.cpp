#include "common/errors.h"
#include <utility>

namespace aegis {

const char* to_string(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::InvalidDimension: return "invalid_dimension";
        case ValidationReason::DimensionMismatch: return "dimension_mismatch";
        case ValidationReason::InvalidBasis: return "invalid_basis";
        case ValidationReason::MalformedRecord: return "malformed_record";
        case ValidationReason::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

ValidationError::ValidationError(ValidationReason reason, const std::string& message)
    : GovernanceError(std::string(to_string(reason)) + ": " + message), reason_(reason) {}

RateLimitExceeded::RateLimitExceeded(const std::string& operation, const std::string& identity,
                                     int retry_after)
    : GovernanceError("rate limit exceeded for " + operation + ":" + identity + ", retry after " +
                      std::to_string(retry_after) + "s"),
      operation_(operation),
      identity_(identity),
      retry_after_(retry_after) {}

CircuitOpenError::CircuitOpenError(const std::string& operation, const std::string& identity,
                                   int retry_after)
    : GovernanceError("circuit open for " + operation + ":" + identity + ", retry after " +
                      std::to_string(retry_after) + "s"),
      operation_(operation),
      identity_(identity),
      retry_after_(retry_after) {}

OperationFailed::OperationFailed(const std::string& operation, const std::string& reason,
                                 std::exception_ptr cause)
    : GovernanceError("operation " + operation + " failed: " + reason),
      operation_(operation),
      cause_(std::move(cause)) {}

void OperationFailed::rethrow_cause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
    throw GovernanceError(what());
}

}  // namespace aegis
