#pragma once

#include "caches.hpp"
#include "cancellation.hpp"
#include "metrics.hpp"
#include "models.hpp"
#include "partition_routing.hpp"
#include "query_partition_provider.hpp"
#include "retry_policy.hpp"
#include "transport.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace partition_query {

/// Drives one logical query page by page: routes each request to the right
/// partition key range, recovers from topology changes and stitches the
/// continuation so the next page resumes in the right place.
///
/// Single-flight: calls to executeNext() on one context must not overlap.
/// An overlapping call is rejected with std::logic_error.
class QueryExecutionContext {
public:
    /// Shared, externally owned collaborators.
    struct Collaborators {
        std::shared_ptr<Transport>              transport;
        std::shared_ptr<CollectionCache>        collectionCache;
        std::shared_ptr<RoutingMapProvider>     routingMapProvider;
        std::shared_ptr<QueryPartitionProvider> queryPartitionProvider;
    };

    enum class Phase {
        Idle,
        Dispatching,
        Retrying,
        Succeeded,
        Exhausted,
    };

    struct Stats {
        int       totalPages         = 0;
        int       totalRequests      = 0;   // dispatch attempts, including retried ones
        int       totalRetries       = 0;
        long long totalDocuments     = 0;
        double    totalRequestCharge = 0.0;
    };

    QueryExecutionContext(Collaborators collaborators,
                          ResourceType resourceType,
                          std::string resourceLink,
                          QuerySpec query,
                          FeedOptions options,
                          bool isContinuationExpected = true,
                          RetryBudget budget = {},
                          bool verbose = false);

    QueryExecutionContext(const QueryExecutionContext&) = delete;
    QueryExecutionContext& operator=(const QueryExecutionContext&) = delete;

    /// Fetch the next page.
    /// @throws QueryError with the cause of a terminal failure.
    FeedResponse executeNext(const CancellationToken& cancellation = CancellationToken());

    /// executeNext() on a worker thread.  The context must outlive the future.
    std::future<FeedResponse> executeNextAsync(CancellationToken cancellation = CancellationToken());

    /// Page through the rest of the query, at most @p maxPages pages.
    std::vector<nlohmann::json> fetchAll(int maxPages,
                                         const CancellationToken& cancellation = CancellationToken());

    /// False once a page came back without a continuation.
    bool hasMoreResults() const { return !mState.finished; }

    /// Continuation for resuming in a new context; empty when finished.
    const std::string& continuation() const { return mState.continuation; }

    Phase phase() const { return mPhase; }
    Stats getStats() const { return mStats; }

    /// Provided ranges cached for @p collectionRid, or nullptr.
    std::shared_ptr<const std::vector<KeyRange>>
    cachedProvidedRanges(const std::string& collectionRid) const;

private:
    using ProvidedRanges = std::shared_ptr<const std::vector<KeyRange>>;

    /// Everything a logical call mutates, owned by this context alone.
    struct ExecutionState {
        std::unordered_map<std::string, ProvidedRanges> providedRangesCache;  // by collection rid
        std::string  continuation;
        bool         finished = false;
        RetryContext retry;
        long long    retries  = -1;   // -1 = not yet attempted in this call
    };

    /// What one attempt found out besides its result.
    struct AttemptInfo {
        std::string collectionRid;
        std::string partitionKeyRangeId;
    };

    Collaborators    mCollaborators;
    ResourceType     mResourceType;
    std::string      mResourceLink;
    QuerySpec        mQuery;
    FeedOptions      mOptions;
    bool             mIsContinuationExpected;
    RetryBudget      mBudget;
    bool             mVerbose;
    RetryPolicyChain mPolicies;

    ExecutionState                 mState;
    Phase                          mPhase = Phase::Idle;
    Stats                          mStats{};
    SchedulingStopwatch            mSchedulingStopwatch;
    FetchExecutionRangeAccumulator mExecutionRanges;
    std::atomic<bool>              mInFlight{false};

    QueryRequest createRequest() const;

    /// Counts the attempt in Stats::totalRequests and hands it to the transport.
    DispatchResult dispatch(const QueryRequest& request, const CancellationToken& cancellation);

    DispatchResult executeOnce(ExecutionState& state,
                               const CancellationToken& cancellation,
                               AttemptInfo& info);

    /// Provided ranges + resolved target, or std::nullopt when the routing
    /// map has no consistent answer.
    std::optional<std::pair<ResolvedRangeInfo, ProvidedRanges>>
    tryGetTargetPartitionKeyRange(ExecutionState& state,
                                  const QueryRequest& request,
                                  const CollectionDescriptor& collection,
                                  const std::vector<CompositeContinuationToken>& suppliedTokens);

    void applyRefresh(ExecutionState& state, RefreshTarget target, const AttemptInfo& info);

    void log(const std::string& line) const;
};

const char* toString(QueryExecutionContext::Phase phase);

} // namespace partition_query
