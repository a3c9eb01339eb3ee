#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace partition_query {

/// Classification of a failed dispatch, as reported by the transport.
enum class FailureKind {
    PartitionKeyRangeGone,  // targeted range was split/merged away
    InvalidPartition,       // cached collection identity is stale
    NotFound,
    BadRequest,
    Throttled,
    Transient,
};

const char* toString(FailureKind kind);

/// A failed dispatch, carried as a value rather than thrown.
struct Failure {
    FailureKind kind       = FailureKind::Transient;
    int         httpStatus = 0;
    int         subStatus  = 0;
    std::string message;
    std::string activityId;

    std::string describe() const;
};

/// Caller-visible error classes.
enum class ErrorKind {
    InputInvalid,          // never retried, nothing dispatched
    RoutingUnresolvable,   // no consistent mapping after one forced refresh
    RetryExhausted,        // a claimed failure repeated past the budget
    Dispatch,              // unclaimed server failure, surfaced on first occurrence
    Cancelled,
};

const char* toString(ErrorKind kind);

/// Terminal error of a logical fetch.
class QueryError : public std::runtime_error {
public:
    QueryError(ErrorKind kind, const std::string& message);
    QueryError(ErrorKind kind, const Failure& failure);

    ErrorKind kind() const { return mKind; }

    /// Underlying dispatch failure, verbatim, for Dispatch / RetryExhausted.
    const std::optional<Failure>& failure() const { return mFailure; }

private:
    ErrorKind              mKind;
    std::optional<Failure> mFailure;
};

} // namespace partition_query
