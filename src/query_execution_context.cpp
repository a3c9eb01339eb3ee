#include "query_execution_context.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "http_constants.hpp"
#include "util.hpp"

#include <iostream>
#include <set>
#include <stdexcept>
#include <thread>

namespace partition_query {

namespace {

/// Rejects a second executeNext() while one is running on the same context.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : mFlag(flag) {
        if (mFlag.exchange(true)) {
            throw std::logic_error(
                "QueryExecutionContext is single-flight: executeNext() called "
                "while a previous call is still running");
        }
    }
    ~InFlightGuard() { mFlag.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& mFlag;
};

/// Header value validated in createRequest(); absent means false.
bool crossPartitionEnabled(const QueryRequest& request) {
    auto it = request.headers.find(headers::kEnableCrossPartitionQuery);
    if (it == request.headers.end()) return false;
    return tryParseBool(it->second).value_or(false);
}

} // namespace

const char* toString(QueryExecutionContext::Phase phase) {
    switch (phase) {
        case QueryExecutionContext::Phase::Idle:        return "Idle";
        case QueryExecutionContext::Phase::Dispatching: return "Dispatching";
        case QueryExecutionContext::Phase::Retrying:    return "Retrying";
        case QueryExecutionContext::Phase::Succeeded:   return "Succeeded";
        case QueryExecutionContext::Phase::Exhausted:   return "Exhausted";
    }
    return "Unknown";
}

QueryExecutionContext::QueryExecutionContext(Collaborators collaborators,
                                             ResourceType resourceType,
                                             std::string resourceLink,
                                             QuerySpec query,
                                             FeedOptions options,
                                             bool isContinuationExpected,
                                             RetryBudget budget,
                                             bool verbose)
    : mCollaborators(std::move(collaborators))
    , mResourceType(resourceType)
    , mResourceLink(std::move(resourceLink))
    , mQuery(std::move(query))
    , mOptions(std::move(options))
    , mIsContinuationExpected(isContinuationExpected)
    , mBudget(budget)
    , mVerbose(verbose)
    , mPolicies(RetryPolicyChain::forResourceType(resourceType))
{
    if (!mCollaborators.transport || !mCollaborators.collectionCache ||
        !mCollaborators.routingMapProvider || !mCollaborators.queryPartitionProvider) {
        throw std::invalid_argument("QueryExecutionContext: all collaborators are required");
    }
    if (mOptions.requestContinuation) {
        mState.continuation = *mOptions.requestContinuation;
    }
    mSchedulingStopwatch.ready();
}

// ---------------------------------------------------------------------------
// Public: one logical fetch
// ---------------------------------------------------------------------------

FeedResponse QueryExecutionContext::executeNext(const CancellationToken& cancellation)
{
    InFlightGuard guard(mInFlight);

    ExecutionState& state = mState;
    state.retry   = RetryContext{};
    state.retries = -1;
    // Records left by a call that failed terminally belong to that call.
    mExecutionRanges.getExecutionRanges();

    while (true) {
        if (cancellation.isCancellationRequested()) {
            mPhase = Phase::Exhausted;
            throw QueryError(ErrorKind::Cancelled,
                             "query on " + mResourceLink + " cancelled before attempt "
                             + std::to_string(state.retry.attempts + 1));
        }

        mPhase = Phase::Dispatching;
        ++state.retries;
        ++state.retry.attempts;

        AttemptInfo info;
        mExecutionRanges.beginFetchRange();
        mSchedulingStopwatch.start();
        DispatchResult result = [&] {
            try {
                return executeOnce(state, cancellation, info);
            } catch (...) {
                mSchedulingStopwatch.stop();
                mPhase = Phase::Exhausted;
                throw;
            }
        }();
        mSchedulingStopwatch.stop();

        // --- success ---
        if (result.ok()) {
            FeedResponse& response = result.response();
            mExecutionRanges.endFetchRange(static_cast<long long>(response.count()),
                                           state.retries, response.activityId,
                                           info.partitionKeyRangeId);

            ClientObservations observations;
            observations.partitionKeyRangeId =
                info.partitionKeyRangeId.empty() ? "0" : info.partitionKeyRangeId;
            observations.retries             = state.retries;
            observations.executionRanges     = mExecutionRanges.getExecutionRanges();
            observations.schedulingElapsedMs = mSchedulingStopwatch.elapsedMs();

            const std::string rawMetrics = response.header(headers::kQueryMetrics);
            FeedResponse page = attachDiagnostics(
                std::move(response),
                rawMetrics.empty() ? std::nullopt : std::optional<std::string>(rawMetrics),
                observations);

            state.continuation = page.responseContinuation();
            state.finished     = state.continuation.empty();

            ++mStats.totalPages;
            mStats.totalDocuments     += static_cast<long long>(page.count());
            mStats.totalRequestCharge += page.requestCharge;
            mPhase = Phase::Succeeded;

            if (mVerbose) {
                log("Page from range " + observations.partitionKeyRangeId + ": "
                    + std::to_string(page.count()) + " documents, retries="
                    + std::to_string(state.retries)
                    + (state.finished ? ", query finished" : ""));
            }
            return page;
        }

        // --- failure: ask the policy chain ---
        const Failure& failure = result.failure();
        mExecutionRanges.endFetchRange(0, state.retries, failure.activityId,
                                       info.partitionKeyRangeId);

        if (cancellation.isCancellationRequested()) {
            mPhase = Phase::Exhausted;
            throw QueryError(ErrorKind::Cancelled,
                             "query on " + mResourceLink + " cancelled during attempt "
                             + std::to_string(state.retry.attempts) + ": "
                             + failure.describe());
        }

        const char* claimedBy = nullptr;
        RetryAdvice advice = mPolicies.classify(failure, state.retry, &claimedBy);

        if (advice.decision == RetryDecision::NotClaimed) {
            mPhase = Phase::Exhausted;
            throw QueryError(ErrorKind::Dispatch, failure);
        }
        if (advice.decision == RetryDecision::GiveUp || !mBudget.allows(state.retry, advice)) {
            if (mVerbose) {
                std::cerr << "[Retry] " << claimedBy << " gave up after "
                          << state.retry.attempts << " attempts\n";
            }
            mPhase = Phase::Exhausted;
            throw QueryError(ErrorKind::RetryExhausted, failure);
        }

        mPhase = Phase::Retrying;
        applyRefresh(state, advice.refresh, info);
        if (advice.chargesBudget) ++state.retry.budgetedRetries;
        ++mStats.totalRetries;

        if (mVerbose) {
            std::cerr << "[Retry] " << failure.describe() << " claimed by "
                      << claimedBy << ", attempt " << state.retry.attempts
                      << ", retrying\n";
        }

        if (advice.backoff.count() > 0) {
            std::this_thread::sleep_for(advice.backoff);
        }
    }
}

std::future<FeedResponse> QueryExecutionContext::executeNextAsync(CancellationToken cancellation)
{
    return std::async(std::launch::async,
                      [this, cancellation] { return executeNext(cancellation); });
}

std::vector<nlohmann::json> QueryExecutionContext::fetchAll(int maxPages,
                                                            const CancellationToken& cancellation)
{
    std::vector<nlohmann::json> documents;

    for (int page = 0; page < maxPages && hasMoreResults(); ++page) {
        FeedResponse response = executeNext(cancellation);
        documents.insert(documents.end(),
                         std::make_move_iterator(response.documents.begin()),
                         std::make_move_iterator(response.documents.end()));
    }
    return documents;
}

std::shared_ptr<const std::vector<KeyRange>>
QueryExecutionContext::cachedProvidedRanges(const std::string& collectionRid) const
{
    auto it = mState.providedRangesCache.find(collectionRid);
    return it == mState.providedRangesCache.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Private: one attempt
// ---------------------------------------------------------------------------

QueryRequest QueryExecutionContext::createRequest() const
{
    QueryRequest request;
    request.resourceType = mResourceType;
    request.resourceLink = mResourceLink;
    request.query        = mQuery;

    auto& h = request.headers;
    h[headers::kIsQuery]                = "true";
    h[headers::kMaxItemCount]           = std::to_string(mOptions.maxItemCount);
    h[headers::kIsContinuationExpected] = mIsContinuationExpected ? "true" : "false";
    h[headers::kVersion] = (mOptions.version && !mOptions.version->empty())
        ? *mOptions.version : versions::kCurrentVersion;

    if (mOptions.enableCrossPartitionQuery) {
        const std::string& raw = *mOptions.enableCrossPartitionQuery;
        if (!tryParseBool(raw)) {
            throw QueryError(ErrorKind::InputInvalid,
                             "Invalid value '" + raw + "' for header "
                             + headers::kEnableCrossPartitionQuery
                             + " (expected true or false)");
        }
        h[headers::kEnableCrossPartitionQuery] = raw;
    }
    if (!isPartitioned(mResourceType) && (mOptions.partitionKey || mOptions.partitionKeyRangeId)) {
        throw QueryError(ErrorKind::InputInvalid,
                         std::string("Resource type ") + toString(mResourceType)
                         + " is not partitioned; "
                         + (mOptions.partitionKey ? "partitionKey" : "partitionKeyRangeId")
                         + " is not supported for its queries");
    }
    if (mOptions.partitionKey) {
        h[headers::kPartitionKey] = *mOptions.partitionKey;
    }
    if (!mState.continuation.empty()) {
        h[headers::kContinuation] = mState.continuation;
    }
    return request;
}

DispatchResult QueryExecutionContext::dispatch(const QueryRequest& request,
                                               const CancellationToken& cancellation)
{
    ++mStats.totalRequests;
    return mCollaborators.transport->send(request, cancellation);
}

DispatchResult QueryExecutionContext::executeOnce(ExecutionState& state,
                                                  const CancellationToken& cancellation,
                                                  AttemptInfo& info)
{
    // A new request every attempt; nothing carries over from a failed one.
    QueryRequest request = createRequest();

    if (request.hasHeader(headers::kPartitionKey) || !isPartitioned(request.resourceType)) {
        return dispatch(request, cancellation);
    }

    CollectionCache& collectionCache = *mCollaborators.collectionCache;
    auto collection = collectionCache.resolveCollection({mResourceLink, false});
    if (!collection) {
        Failure notFound;
        notFound.kind       = FailureKind::NotFound;
        notFound.httpStatus = 404;
        notFound.message    = "Collection " + mResourceLink + " does not exist";
        return DispatchResult::failure(notFound);
    }
    info.collectionRid = collection->resourceId;

    if (mOptions.partitionKeyRangeId && !mOptions.partitionKeyRangeId->empty()) {
        info.partitionKeyRangeId = *mOptions.partitionKeyRangeId;
        request.routeTo(collection->resourceId, info.partitionKeyRangeId);
        return dispatch(request, cancellation);
    }

    // Single-partition collection: its only range is "0".
    if (!collection->partitionKey) {
        info.partitionKeyRangeId = "0";
        request.routeTo(collection->resourceId, info.partitionKeyRangeId);
        return dispatch(request, cancellation);
    }

    if (!mCollaborators.queryPartitionProvider->isAvailable()) {
        request.useGatewayMode = true;
        return dispatch(request, cancellation);
    }

    std::vector<CompositeContinuationToken> suppliedTokens;
    try {
        suppliedTokens = extractContinuation(request.headers);
    } catch (const std::invalid_argument& e) {
        throw QueryError(ErrorKind::InputInvalid, e.what());
    }

    auto routing = tryGetTargetPartitionKeyRange(state, request, *collection, suppliedTokens);
    if (!routing) {
        // The name may now point at a re-created collection.
        if (mVerbose) log("Routing not resolved; refreshing " + mResourceLink);
        collection = collectionCache.resolveCollection({mResourceLink, true});
        if (collection) {
            info.collectionRid = collection->resourceId;
            routing = tryGetTargetPartitionKeyRange(state, request, *collection, suppliedTokens);
        }
    }

    if (!routing) {
        throw QueryError(ErrorKind::RoutingUnresolvable,
                         utcTimestamp() + ": could not resolve a partition key range "
                         "after a forced refresh of " + mResourceLink
                         + " (collectionRid " + info.collectionRid
                         + ") for the supplied tokens "
                         + (suppliedTokens.empty() ? std::string("<none>")
                                                   : serializeContinuation(suppliedTokens)));
    }

    const ResolvedRangeInfo& resolved = routing->first;
    info.partitionKeyRangeId = resolved.resolvedRange.id;
    request.routeTo(collection->resourceId, resolved.resolvedRange.id);

    if (!resolved.continuationTokens.empty()) {
        const auto& cursor = resolved.continuationTokens.front();
        if (cursor.min != resolved.resolvedRange.minInclusive ||
            cursor.max != resolved.resolvedRange.maxExclusive) {
            request.headers[headers::kStartEpk] = cursor.min;
            request.headers[headers::kEndEpk]   = cursor.max;
        }
        // A split hands the parent's backend token to each child.
        if (cursor.token.empty()) {
            request.headers.erase(headers::kContinuation);
        } else {
            request.headers[headers::kContinuation] = cursor.token;
        }
    }

    if (mVerbose) {
        log("Routing " + mResourceLink + " to range " + resolved.resolvedRange.id
            + " [" + resolved.resolvedRange.minInclusive + ", "
            + resolved.resolvedRange.maxExclusive + ")");
    }

    DispatchResult result = dispatch(request, cancellation);
    if (!result.ok()) return result;

    if (!tryAddRangeToContinuation(result.response().headers, *routing->second,
                                   *mCollaborators.routingMapProvider,
                                   collection->resourceId, resolved)) {
        throw QueryError(ErrorKind::RoutingUnresolvable,
                         utcTimestamp() + ": could not compute the next continuation for "
                         "collectionRid " + collection->resourceId
                         + " with the supplied tokens "
                         + (suppliedTokens.empty() ? std::string("<none>")
                                                   : serializeContinuation(suppliedTokens)));
    }
    return result;
}

std::optional<std::pair<ResolvedRangeInfo, QueryExecutionContext::ProvidedRanges>>
QueryExecutionContext::tryGetTargetPartitionKeyRange(
    ExecutionState& state,
    const QueryRequest& request,
    const CollectionDescriptor& collection,
    const std::vector<CompositeContinuationToken>& suppliedTokens)
{
    RoutingMapProvider& routingMap = *mCollaborators.routingMapProvider;
    const bool enableCrossPartition = crossPartitionEnabled(request);

    ProvidedRanges provided;
    auto cached = state.providedRangesCache.find(collection.resourceId);
    if (cached != state.providedRangesCache.end()) {
        provided = cached->second;
    } else {
        std::vector<KeyRange> ranges;
        if (!mQuery.text.empty()) {
            ranges = mCollaborators.queryPartitionProvider->getProvidedRanges(
                mQuery, *collection.partitionKey, enableCrossPartition);
        } else {
            ranges.push_back(KeyRange::fullRange());
        }

        if (!enableCrossPartition && !mQuery.text.empty()) {
            std::set<std::string> spanned;
            for (const auto& r : ranges) {
                auto overlapping = routingMap.getOverlappingRanges(
                    collection.resourceId, r, /*forceRefresh=*/false);
                if (!overlapping) return std::nullopt;
                for (const auto& pk : *overlapping) spanned.insert(pk.id);
            }
            if (spanned.size() > 1) {
                throw QueryError(ErrorKind::InputInvalid,
                                 "Query on " + mResourceLink + " spans "
                                 + std::to_string(spanned.size())
                                 + " partition key ranges but "
                                 + headers::kEnableCrossPartitionQuery
                                 + " is not true");
            }
        }

        provided = std::make_shared<const std::vector<KeyRange>>(std::move(ranges));
        state.providedRangesCache[collection.resourceId] = provided;
    }

    auto resolved = tryGetTargetRange(*provided, routingMap, collection.resourceId, suppliedTokens);
    if (!resolved) return std::nullopt;
    return std::make_pair(std::move(*resolved), provided);
}

void QueryExecutionContext::applyRefresh(ExecutionState& state,
                                         RefreshTarget target,
                                         const AttemptInfo& info)
{
    switch (target) {
        case RefreshTarget::CollectionCache:
            mCollaborators.collectionCache->invalidate(mResourceLink);
            state.retry.collectionCacheRefreshed = true;
            if (mVerbose) log("Invalidated collection cache entry " + mResourceLink);
            break;

        case RefreshTarget::PartitionMap: {
            std::string rid = info.collectionRid;
            if (rid.empty()) {
                auto collection = mCollaborators.collectionCache->resolveCollection({mResourceLink, false});
                if (collection) rid = collection->resourceId;
            }
            if (!rid.empty()) {
                mCollaborators.routingMapProvider->invalidate(rid);
                if (mVerbose) log("Invalidated partition map of " + rid);
            }
            state.retry.partitionMapRefreshed = true;
            break;
        }

        case RefreshTarget::None:
            break;
    }
}

void QueryExecutionContext::log(const std::string& line) const {
    std::cerr << "[QueryContext] " << line << "\n";
}

} // namespace partition_query
