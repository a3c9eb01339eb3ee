#pragma once

#include "caches.hpp"
#include "continuation.hpp"
#include "models.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace partition_query {

/// Where the next request goes and what is left after it.
struct ResolvedRangeInfo {
    PartitionKeyRange                       resolvedRange;
    /// Cursor records still to visit; element 0 belongs to resolvedRange.
    /// Empty when the query starts at the beginning of resolvedRange.
    std::vector<CompositeContinuationToken> continuationTokens;
};

/// Parse the composite continuation in @p requestHeaders and replace it with the
/// backend token of its first record, which is what the target partition
/// understands.  Returns the parsed records (empty when none was supplied).
/// Throws std::invalid_argument on a malformed continuation.
std::vector<CompositeContinuationToken>
extractContinuation(std::map<std::string, std::string>& requestHeaders);

/// Pick the partition key range to target.
///
/// Without @p suppliedTokens the first range overlapping the first provided
/// range is chosen.  With tokens, the first token's range is looked up; when
/// its id no longer owns the recorded bounds (split or merge), the ranges now
/// covering those bounds replace it, ascending, each inheriting the backend
/// token.  Returns std::nullopt when the routing map has no consistent answer.
std::optional<ResolvedRangeInfo>
tryGetTargetRange(const std::vector<KeyRange>& providedRanges,
                  RoutingMapProvider& routingMapProvider,
                  const std::string& collectionRid,
                  const std::vector<CompositeContinuationToken>& suppliedTokens);

/// Rewrite the continuation in @p responseHeaders from the backend's token
/// into a composite token: stay on the resolved range while it has more,
/// otherwise advance to the next range the provided ranges still need.
/// Removes the header when the query is done.  Returns false when the
/// routing map cannot be read for @p collectionRid.
bool tryAddRangeToContinuation(std::map<std::string, std::string>& responseHeaders,
                               const std::vector<KeyRange>& providedRanges,
                               RoutingMapProvider& routingMapProvider,
                               const std::string& collectionRid,
                               const ResolvedRangeInfo& resolvedRangeInfo);

} // namespace partition_query
