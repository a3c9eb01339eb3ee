#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "models.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace partition_query {

/// Physical request for one attempt.  Built fresh for every attempt.
struct QueryRequest {
    ResourceType                       resourceType = ResourceType::Document;
    std::string                        resourceLink;   // "dbs/app/colls/orders"
    QuerySpec                          query;
    std::map<std::string, std::string> headers;

    std::optional<std::string> targetPartitionKeyRangeId;  // set by routing
    std::string                targetCollectionRid;
    bool                       useGatewayMode = false;     // forwarded unrouted

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
    bool hasHeader(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() && !it->second.empty();
    }

    void routeTo(const std::string& collectionRid, const std::string& rangeId) {
        targetCollectionRid       = collectionRid;
        targetPartitionKeyRangeId = rangeId;
    }
};

/// Outcome of one dispatch: a page or a classified failure.
class DispatchResult {
public:
    static DispatchResult success(FeedResponse response) {
        DispatchResult r;
        r.mResponse = std::move(response);
        return r;
    }
    static DispatchResult failure(Failure failure) {
        DispatchResult r;
        r.mFailure = std::move(failure);
        return r;
    }

    bool ok() const { return mResponse.has_value(); }

    FeedResponse&       response()       { return *mResponse; }
    const FeedResponse& response() const { return *mResponse; }
    const Failure&      failure()  const { return *mFailure; }

private:
    DispatchResult() = default;

    std::optional<FeedResponse> mResponse;
    std::optional<Failure>      mFailure;
};

/// Sends a request and reports the outcome.  Implementations handle their own
/// connection-level retries and backoff and honor the cancellation token
/// between them.
class Transport {
public:
    virtual ~Transport() = default;

    virtual DispatchResult send(const QueryRequest& request,
                                const CancellationToken& cancellation) = 0;
};

} // namespace partition_query
