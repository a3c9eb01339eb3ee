#include "caches.hpp"

#include <iostream>

namespace partition_query {

// ---------------------------------------------------------------------------
// MetadataCollectionCache
// ---------------------------------------------------------------------------

MetadataCollectionCache::MetadataCollectionCache(std::shared_ptr<MetadataSource> source,
                                                 bool verbose)
    : mSource(std::move(source))
    , mVerbose(verbose) {}

std::optional<CollectionDescriptor>
MetadataCollectionCache::resolveCollection(const RequestContext& context)
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (context.forceNameCacheRefresh) {
            mByLink.erase(context.resourceLink);
        } else {
            auto it = mByLink.find(context.resourceLink);
            if (it != mByLink.end()) return it->second;
        }
        ++mSourceReads;
    }

    // Read outside the lock; two racing readers simply both refresh.
    auto fresh = mSource->readCollection(context.resourceLink);

    if (mVerbose) {
        std::cerr << "[CollectionCache] Loaded " << context.resourceLink << " -> "
                  << (fresh ? fresh->resourceId : std::string("<not found>"))
                  << (context.forceNameCacheRefresh ? " (forced)" : "") << "\n";
    }

    if (!fresh) return std::nullopt;

    std::lock_guard<std::mutex> lock(mMutex);
    mByLink[context.resourceLink] = *fresh;
    return fresh;
}

void MetadataCollectionCache::invalidate(const std::string& link) {
    std::lock_guard<std::mutex> lock(mMutex);
    mByLink.erase(link);
}

int MetadataCollectionCache::sourceReads() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSourceReads;
}

// ---------------------------------------------------------------------------
// PartitionKeyRangeCache
// ---------------------------------------------------------------------------

PartitionKeyRangeCache::PartitionKeyRangeCache(std::shared_ptr<MetadataSource> source,
                                               bool verbose)
    : mSource(std::move(source))
    , mVerbose(verbose) {}

std::shared_ptr<const CollectionRoutingMap>
PartitionKeyRangeCache::tryLookup(const std::string& collectionRid, bool forceRefresh)
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (forceRefresh) {
            mByRid.erase(collectionRid);
        } else {
            auto it = mByRid.find(collectionRid);
            if (it != mByRid.end()) return it->second;
        }
        ++mSourceReads;
    }

    auto ranges = mSource->readPartitionKeyRanges(collectionRid);
    if (!ranges) {
        if (mVerbose) {
            std::cerr << "[RoutingMap] Collection " << collectionRid << " not found\n";
        }
        return nullptr;
    }

    auto routingMap = CollectionRoutingMap::tryCreate(collectionRid, std::move(*ranges));
    if (!routingMap) {
        // Caught mid-transition; the next lookup reads again.
        std::cerr << "[RoutingMap] Warning: inconsistent partition map for "
                  << collectionRid << "\n";
        return nullptr;
    }

    if (mVerbose) {
        std::cerr << "[RoutingMap] Loaded " << routingMap->orderedRanges().size()
                  << " ranges for " << collectionRid
                  << (forceRefresh ? " (forced)" : "") << "\n";
    }

    auto snapshot = std::make_shared<const CollectionRoutingMap>(std::move(*routingMap));
    std::lock_guard<std::mutex> lock(mMutex);
    mByRid[collectionRid] = snapshot;
    return snapshot;
}

std::optional<std::vector<PartitionKeyRange>>
PartitionKeyRangeCache::getOverlappingRanges(const std::string& collectionRid,
                                             const KeyRange& range,
                                             bool forceRefresh)
{
    auto routingMap = tryLookup(collectionRid, forceRefresh);
    if (!routingMap) return std::nullopt;
    return routingMap->getOverlappingRanges(range);
}

void PartitionKeyRangeCache::invalidate(const std::string& collectionRid) {
    std::lock_guard<std::mutex> lock(mMutex);
    mByRid.erase(collectionRid);
}

int PartitionKeyRangeCache::sourceReads() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mSourceReads;
}

} // namespace partition_query
