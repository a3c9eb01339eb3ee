#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace partition_query {

/// Immutable snapshot of a collection's partition map.
/// The ranges are sorted by min and tile ["", "FF") exactly.
class CollectionRoutingMap {
public:
    /// Build a map from an unordered range list.  Returns std::nullopt when the
    /// ranges leave a gap, overlap, or do not span the whole key space
    /// (a map caught mid split/merge).
    static std::optional<CollectionRoutingMap>
    tryCreate(const std::string& collectionRid, std::vector<PartitionKeyRange> ranges);

    const std::string& collectionRid() const { return mCollectionRid; }
    const std::vector<PartitionKeyRange>& orderedRanges() const { return mRanges; }

    /// Ranges overlapping @p range, ascending by min.
    std::vector<PartitionKeyRange> getOverlappingRanges(const KeyRange& range) const;

    /// Ranges overlapping any of @p ranges, ascending, each returned once.
    std::vector<PartitionKeyRange>
    getOverlappingRanges(const std::vector<KeyRange>& ranges) const;

    const PartitionKeyRange* tryGetRangeById(const std::string& id) const;

    /// Range owning @p effectiveKey.
    const PartitionKeyRange* tryGetRangeByEffectivePartitionKey(const std::string& effectiveKey) const;

private:
    CollectionRoutingMap(std::string collectionRid, std::vector<PartitionKeyRange> ranges)
        : mCollectionRid(std::move(collectionRid)), mRanges(std::move(ranges)) {}

    std::string                    mCollectionRid;
    std::vector<PartitionKeyRange> mRanges;
};

} // namespace partition_query
