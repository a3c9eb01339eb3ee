#pragma once

#include "caches.hpp"
#include "http_client.hpp"
#include "models.hpp"
#include "transport.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace partition_query {

// ---------------------------------------------------------------------------
// Response mapping
// ---------------------------------------------------------------------------

/// Classify a non-2xx gateway response.
Failure classifyFailure(unsigned int httpStatus, int subStatus, const std::string& message);

/// Map a raw gateway response to a page or a classified failure.
/// A 2xx body that is not a {"Documents": [...]} object is a BadRequest
/// failure, not an exception.
DispatchResult parseFeedResponse(const HttpClient::Response& response);

/// Map a collection resource. Returns std::nullopt if "_rid" is missing.
std::optional<CollectionDescriptor> parseCollection(const std::string& link,
                                                    const nlohmann::json& body);

/// Map a {"PartitionKeyRanges": [...]} feed.
/// Throws std::runtime_error if the expected shape is missing.
std::vector<PartitionKeyRange> parsePartitionKeyRanges(const nlohmann::json& body);

/// JSON body of a query request.
nlohmann::json queryBody(const QuerySpec& query);

// ---------------------------------------------------------------------------
// HTTP collaborators
// ---------------------------------------------------------------------------

/// Transport over the gateway's REST API.  Throttling, 5xx and network
/// errors are retried here with exponential backoff before being reported.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(std::shared_ptr<HttpClient> client, bool verbose = false);

    DispatchResult send(const QueryRequest& request,
                        const CancellationToken& cancellation) override;

private:
    static constexpr int kMaxAttempts = 6;

    std::shared_ptr<HttpClient> mClient;
    bool                        mVerbose;

    static bool isRetryableStatus(unsigned int status);
};

/// Collection and partition map metadata read from the gateway.
class HttpMetadataSource : public MetadataSource {
public:
    explicit HttpMetadataSource(std::shared_ptr<HttpClient> client, bool verbose = false);

    std::optional<CollectionDescriptor> readCollection(const std::string& link) override;

    std::optional<std::vector<PartitionKeyRange>>
    readPartitionKeyRanges(const std::string& collectionRid) override;

private:
    std::shared_ptr<HttpClient> mClient;
    bool                        mVerbose;
};

} // namespace partition_query
