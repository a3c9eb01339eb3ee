#pragma once

#include "models.hpp"
#include "routing_map.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace partition_query {

/// What the collection cache needs to know about the request being resolved.
struct RequestContext {
    std::string resourceLink;                 // "dbs/app/colls/orders"
    bool        forceNameCacheRefresh = false;
};

/// Name -> collection identity.  Shared between execution contexts; must be
/// safe for concurrent resolve and invalidate.
class CollectionCache {
public:
    virtual ~CollectionCache() = default;

    /// Resolve the collection addressed by @p context.  A set
    /// forceNameCacheRefresh discards the cached entry first.
    virtual std::optional<CollectionDescriptor> resolveCollection(const RequestContext& context) = 0;

    /// Drop the cached entry for @p link.  Idempotent.
    virtual void invalidate(const std::string& link) = 0;
};

/// Collection rid -> partition map.  Shared, concurrent, idempotent invalidation.
class RoutingMapProvider {
public:
    virtual ~RoutingMapProvider() = default;

    /// Ranges overlapping @p range, ascending by min.  std::nullopt when the
    /// collection is unknown or its map is inconsistent.
    virtual std::optional<std::vector<PartitionKeyRange>>
    getOverlappingRanges(const std::string& collectionRid,
                         const KeyRange& range,
                         bool forceRefresh) = 0;

    virtual void invalidate(const std::string& collectionRid) = 0;
};

/// Authoritative metadata, e.g. the gateway's REST endpoints.
class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    virtual std::optional<CollectionDescriptor> readCollection(const std::string& link) = 0;

    virtual std::optional<std::vector<PartitionKeyRange>>
    readPartitionKeyRanges(const std::string& collectionRid) = 0;
};

// ---------------------------------------------------------------------------
// Reference implementations over a MetadataSource
// ---------------------------------------------------------------------------

class MetadataCollectionCache : public CollectionCache {
public:
    explicit MetadataCollectionCache(std::shared_ptr<MetadataSource> source,
                                     bool verbose = false);

    std::optional<CollectionDescriptor> resolveCollection(const RequestContext& context) override;
    void invalidate(const std::string& link) override;

    /// Number of reads that went to the source.
    int sourceReads() const;

private:
    std::shared_ptr<MetadataSource> mSource;
    bool                            mVerbose;

    mutable std::mutex                                    mMutex;
    std::unordered_map<std::string, CollectionDescriptor> mByLink;
    int                                                   mSourceReads = 0;
};

class PartitionKeyRangeCache : public RoutingMapProvider {
public:
    explicit PartitionKeyRangeCache(std::shared_ptr<MetadataSource> source,
                                    bool verbose = false);

    std::optional<std::vector<PartitionKeyRange>>
    getOverlappingRanges(const std::string& collectionRid,
                         const KeyRange& range,
                         bool forceRefresh) override;

    void invalidate(const std::string& collectionRid) override;

    /// Current snapshot, loading it if absent.
    std::shared_ptr<const CollectionRoutingMap> tryLookup(const std::string& collectionRid,
                                                          bool forceRefresh);

    int sourceReads() const;

private:
    std::shared_ptr<MetadataSource> mSource;
    bool                            mVerbose;

    mutable std::mutex mMutex;
    std::unordered_map<std::string, std::shared_ptr<const CollectionRoutingMap>> mByRid;
    int mSourceReads = 0;
};

} // namespace partition_query
