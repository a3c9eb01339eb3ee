#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace partition_query {

/// Cursor into one partition key range: the backend's own continuation for
/// that range plus the range's identity and bounds at the time it was issued.
struct CompositeContinuationToken {
    std::string rangeId;
    std::string min;         // inclusive
    std::string max;         // exclusive
    std::string token;       // backend continuation; empty = start of range

    KeyRange range() const { return {min, max, true, false}; }

    bool operator==(const CompositeContinuationToken& o) const {
        return rangeId == o.rangeId && min == o.min && max == o.max && token == o.token;
    }
};

/// Serialize to the compact JSON array carried in the continuation header.
/// Object keys are emitted sorted, so a parsed canonical token re-serializes
/// to the identical string.
std::string serializeContinuation(const std::vector<CompositeContinuationToken>& tokens);

/// Parse a continuation header value.  Empty input yields an empty list.
/// Throws std::invalid_argument if the value is not a well-formed token list.
std::vector<CompositeContinuationToken> parseContinuation(const std::string& value);

} // namespace partition_query
