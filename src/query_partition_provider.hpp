#pragma once

#include "models.hpp"

#include <vector>

namespace partition_query {

/// Extracts the key-space intervals a query has to visit from its
/// partitioning predicates.
class QueryPartitionProvider {
public:
    virtual ~QueryPartitionProvider() = default;

    /// False when the extractor cannot run on this host; queries are then
    /// forwarded to the gateway unrouted.
    virtual bool isAvailable() const { return true; }

    /// Ordered, non-overlapping intervals for @p query against a collection
    /// partitioned by @p definition.  An empty result means no key can match;
    /// the query is then sent to the range owning the lowest key only and
    /// finishes after that range is drained.
    virtual std::vector<KeyRange> getProvidedRanges(const QuerySpec& query,
                                                    const PartitionKeyDefinition& definition,
                                                    bool enableCrossPartitionQuery) = 0;
};

/// Point range for an equality filter on the partition key, full key space
/// otherwise.
class DefaultQueryPartitionProvider : public QueryPartitionProvider {
public:
    explicit DefaultQueryPartitionProvider(bool available = true) : mAvailable(available) {}

    bool isAvailable() const override { return mAvailable; }

    std::vector<KeyRange> getProvidedRanges(const QuerySpec& query,
                                            const PartitionKeyDefinition& definition,
                                            bool enableCrossPartitionQuery) override;

private:
    bool mAvailable;
};

} // namespace partition_query
