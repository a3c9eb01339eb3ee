#include "errors.hpp"

namespace partition_query {

const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::PartitionKeyRangeGone: return "PartitionKeyRangeGone";
        case FailureKind::InvalidPartition:      return "InvalidPartition";
        case FailureKind::NotFound:              return "NotFound";
        case FailureKind::BadRequest:            return "BadRequest";
        case FailureKind::Throttled:             return "Throttled";
        case FailureKind::Transient:             return "Transient";
    }
    return "Unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InputInvalid:        return "InputInvalid";
        case ErrorKind::RoutingUnresolvable: return "RoutingUnresolvable";
        case ErrorKind::RetryExhausted:      return "RetryExhausted";
        case ErrorKind::Dispatch:            return "Dispatch";
        case ErrorKind::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

std::string Failure::describe() const {
    std::string out = toString(kind);
    if (httpStatus != 0) {
        out += " (HTTP " + std::to_string(httpStatus);
        if (subStatus != 0) out += "/" + std::to_string(subStatus);
        out += ")";
    }
    if (!message.empty()) out += ": " + message;
    if (!activityId.empty()) out += " [activity " + activityId + "]";
    return out;
}

QueryError::QueryError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message)
    , mKind(kind) {}

QueryError::QueryError(ErrorKind kind, const Failure& failure)
    : std::runtime_error(std::string(toString(kind)) + ": " + failure.describe())
    , mKind(kind)
    , mFailure(failure) {}

} // namespace partition_query
