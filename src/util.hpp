#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace partition_query {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8081", etc.
    std::string target;   // path prefix (e.g. "/" or "/gateway")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Case-insensitive "true"/"false", surrounding whitespace ignored.
/// Returns std::nullopt for anything else.
std::optional<bool> tryParseBool(const std::string& value);

/// Map a partition key value onto the effective-partition-key space:
/// FNV-1a 64-bit with the top bit cleared, rendered as 16 uppercase hex digits.
std::string effectivePartitionKey(const std::string& partitionKeyValue);

/// Current time as ISO-8601 UTC, millisecond precision.
std::string utcTimestamp();

} // namespace partition_query
