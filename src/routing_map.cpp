#include "routing_map.hpp"

#include <algorithm>
#include <set>

namespace partition_query {

std::optional<CollectionRoutingMap>
CollectionRoutingMap::tryCreate(const std::string& collectionRid,
                                std::vector<PartitionKeyRange> ranges)
{
    if (ranges.empty()) return std::nullopt;

    std::sort(ranges.begin(), ranges.end(),
              [](const PartitionKeyRange& a, const PartitionKeyRange& b) {
                  return a.minInclusive < b.minInclusive;
              });

    if (ranges.front().minInclusive != kMinimumInclusiveEffectivePartitionKey ||
        ranges.back().maxExclusive  != kMaximumExclusiveEffectivePartitionKey) {
        return std::nullopt;
    }

    std::set<std::string> ids;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        if (!(ranges[i].minInclusive < ranges[i].maxExclusive)) return std::nullopt;
        if (!ids.insert(ranges[i].id).second) return std::nullopt;
        if (i > 0 && ranges[i - 1].maxExclusive != ranges[i].minInclusive) {
            return std::nullopt;
        }
    }

    return CollectionRoutingMap(collectionRid, std::move(ranges));
}

std::vector<PartitionKeyRange>
CollectionRoutingMap::getOverlappingRanges(const KeyRange& range) const {
    std::vector<PartitionKeyRange> result;
    if (range.isEmpty()) return result;

    // First range whose max is above range.min; everything before ends too early.
    auto it = std::upper_bound(mRanges.begin(), mRanges.end(), range.min,
                               [](const std::string& key, const PartitionKeyRange& r) {
                                   return key < r.maxExclusive;
                               });
    for (; it != mRanges.end(); ++it) {
        if (!it->toRange().overlaps(range)) {
            if (it->minInclusive > range.max) break;
            continue;
        }
        result.push_back(*it);
    }
    return result;
}

std::vector<PartitionKeyRange>
CollectionRoutingMap::getOverlappingRanges(const std::vector<KeyRange>& ranges) const {
    std::vector<PartitionKeyRange> result;
    std::set<std::string> seen;
    for (const auto& r : ranges) {
        for (auto& pk : getOverlappingRanges(r)) {
            if (seen.insert(pk.id).second) result.push_back(std::move(pk));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const PartitionKeyRange& a, const PartitionKeyRange& b) {
                  return a.minInclusive < b.minInclusive;
              });
    return result;
}

const PartitionKeyRange* CollectionRoutingMap::tryGetRangeById(const std::string& id) const {
    for (const auto& r : mRanges) {
        if (r.id == id) return &r;
    }
    return nullptr;
}

const PartitionKeyRange*
CollectionRoutingMap::tryGetRangeByEffectivePartitionKey(const std::string& effectiveKey) const {
    auto it = std::upper_bound(mRanges.begin(), mRanges.end(), effectiveKey,
                               [](const std::string& key, const PartitionKeyRange& r) {
                                   return key < r.maxExclusive;
                               });
    if (it == mRanges.end() || !it->toRange().contains(effectiveKey)) return nullptr;
    return &*it;
}

} // namespace partition_query
