#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace partition_query {

/// Bounds of the effective-partition-key space (uppercase hex strings).
inline const std::string kMinimumInclusiveEffectivePartitionKey = "";
inline const std::string kMaximumExclusiveEffectivePartitionKey = "FF";

/// Interval over the effective-partition-key space.
struct KeyRange {
    std::string min;
    std::string max;
    bool        isMinInclusive = true;
    bool        isMaxInclusive = false;

    /// [min, max]
    static KeyRange point(const std::string& key) { return {key, key, true, true}; }

    /// ["", "FF")
    static KeyRange fullRange() {
        return {kMinimumInclusiveEffectivePartitionKey,
                kMaximumExclusiveEffectivePartitionKey, true, false};
    }

    bool isEmpty() const;
    bool contains(const std::string& key) const;
    bool overlaps(const KeyRange& other) const;

    /// True when every key of @p other also lies in this range.
    bool covers(const KeyRange& other) const;

    bool operator==(const KeyRange& other) const {
        return min == other.min && max == other.max
            && isMinInclusive == other.isMinInclusive
            && isMaxInclusive == other.isMaxInclusive;
    }
    bool operator!=(const KeyRange& other) const { return !(*this == other); }
};

/// Interval owned by one physical partition at a point in time.
struct PartitionKeyRange {
    std::string              id;            // e.g. "0", "12"
    std::string              minInclusive;
    std::string              maxExclusive;
    std::vector<std::string> parents;       // ids this range was split/merged from

    KeyRange toRange() const { return {minInclusive, maxExclusive, true, false}; }
};

struct PartitionKeyDefinition {
    std::vector<std::string> paths;         // e.g. {"/tenantId"}
};

/// Cached identity of a collection.
struct CollectionDescriptor {
    std::string                           link;         // "dbs/app/colls/orders"
    std::string                           resourceId;   // internal id, changes on re-create
    std::optional<PartitionKeyDefinition> partitionKey; // absent for single-partition collections
};

enum class ResourceType {
    Document,
    Conflict,
    Collection,
    Database,
    Offer,
};

/// Documents and conflicts live inside partitions; everything else is routed
/// to the collection's metadata partition.
bool isPartitioned(ResourceType type);

const char* toString(ResourceType type);

/// Parameterized query text.
struct QuerySpec {
    std::string                        text;         // "SELECT * FROM c WHERE c.tenantId = @t"
    std::map<std::string, std::string> parameters;   // {"@t": "acme"}
    std::optional<std::string>         partitionKeyValue;  // value of an equality filter on the key path
};

/// Per-query options supplied by the caller.
struct FeedOptions {
    int                        maxItemCount = 100;
    std::optional<std::string> enableCrossPartitionQuery;  // raw "true"/"false"
    std::optional<std::string> requestContinuation;
    std::optional<std::string> partitionKey;        // bypasses routing when set
    std::optional<std::string> partitionKeyRangeId; // explicit physical target
    std::optional<std::string> version;
};

/// Record of one attempt, kept for diagnostics only.
struct FetchExecutionRange {
    std::string activityId;
    double      startTimeMs    = 0.0;   // since stopwatch epoch
    double      endTimeMs      = 0.0;
    std::string partitionId;
    long long   numberOfDocuments = 0;
    long long   retryCount        = 0;
};

/// Client observed counters merged into server metrics.
struct ClientSideMetrics {
    long long                                        retries       = 0;
    double                                           requestCharge = 0.0;
    std::vector<FetchExecutionRange>                 fetchExecutionRanges;
    std::vector<std::pair<std::string, double>>      partitionSchedulingTimeSpans;  // (range id, elapsed ms)
};

/// Parsed server metrics plus the client view of the same fetch.
struct QueryMetrics {
    std::map<std::string, double> serverMetrics;   // "totalExecutionTimeInMs" -> 3.2
    ClientSideMetrics             clientSideMetrics;
    std::string                   activityId;

    double value(const std::string& key) const {
        auto it = serverMetrics.find(key);
        return it == serverMetrics.end() ? 0.0 : it->second;
    }
};

/// One page of a query.
struct FeedResponse {
    std::vector<nlohmann::json>         documents;
    std::map<std::string, std::string>  headers;
    std::map<std::string, QueryMetrics> queryMetrics;   // keyed by partition key range id
    double                              requestCharge = 0.0;
    std::string                         activityId;
    long long                           retryCount = 0;     // engine retries within this fetch

    std::size_t count() const { return documents.size(); }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    /// Composite token for the next call; empty when the query is finished.
    std::string responseContinuation() const;
};

} // namespace partition_query
