#pragma once

#include <string>

namespace partition_query {
namespace headers {

// ---- request ----
inline const std::string kContinuation              = "x-ms-continuation";
inline const std::string kPartitionKey              = "x-ms-documentdb-partitionkey";
inline const std::string kPartitionKeyRangeId       = "x-ms-documentdb-partitionkeyrangeid";
inline const std::string kEnableCrossPartitionQuery = "x-ms-documentdb-query-enablecrosspartition";
inline const std::string kIsContinuationExpected    = "x-ms-documentdb-query-iscontinuationexpected";
inline const std::string kIsQuery                   = "x-ms-documentdb-isquery";
inline const std::string kMaxItemCount              = "x-ms-max-item-count";
inline const std::string kVersion                   = "x-ms-version";
inline const std::string kCollectionRid             = "x-ms-documentdb-collection-rid";
inline const std::string kStartEpk                  = "x-ms-start-epk";   // narrows a range to a sub-window
inline const std::string kEndEpk                    = "x-ms-end-epk";

// ---- response ----
inline const std::string kRequestCharge = "x-ms-request-charge";
inline const std::string kActivityId    = "x-ms-activity-id";
inline const std::string kQueryMetrics  = "x-ms-documentdb-query-metrics";
inline const std::string kSubStatus     = "x-ms-substatus";
inline const std::string kRetryAfterMs  = "x-ms-retry-after-ms";

} // namespace headers

namespace versions {

/// Sent when the caller did not pin a protocol version.
inline const std::string kCurrentVersion = "2018-12-31";

} // namespace versions

namespace substatus {

inline constexpr int kNameCacheIsStale          = 1000;
inline constexpr int kPartitionKeyRangeGone     = 1002;
inline constexpr int kCompletingSplit           = 1007;
inline constexpr int kCompletingPartitionMigration = 1008;

} // namespace substatus
} // namespace partition_query
