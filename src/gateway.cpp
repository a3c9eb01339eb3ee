#include "gateway.hpp"
#include "http_constants.hpp"
#include "util.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace partition_query {

namespace {

int headerInt(const std::map<std::string, std::string>& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return 0;
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        return 0;
    }
}

std::string errorMessage(const std::string& body) {
    try {
        auto parsed = nlohmann::json::parse(body);
        if (parsed.is_object()) {
            return parsed.value("message", parsed.value("code", body));
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON; fall through to the raw text
    }
    return body;
}

} // namespace

// ---------------------------------------------------------------------------
// Response mapping
// ---------------------------------------------------------------------------

Failure classifyFailure(unsigned int httpStatus, int subStatus, const std::string& message) {
    Failure f;
    f.httpStatus = static_cast<int>(httpStatus);
    f.subStatus  = subStatus;
    f.message    = message;

    if (httpStatus == 410) {
        switch (subStatus) {
            case substatus::kPartitionKeyRangeGone:
            case substatus::kCompletingSplit:
                f.kind = FailureKind::PartitionKeyRangeGone;
                break;
            case substatus::kNameCacheIsStale:
            case substatus::kCompletingPartitionMigration:
                f.kind = FailureKind::InvalidPartition;
                break;
            default:
                f.kind = FailureKind::Transient;
                break;
        }
    } else if (httpStatus == 404) {
        f.kind = FailureKind::NotFound;
    } else if (httpStatus == 400) {
        f.kind = FailureKind::BadRequest;
    } else if (httpStatus == 429) {
        f.kind = FailureKind::Throttled;
    } else {
        f.kind = FailureKind::Transient;
    }
    return f;
}

DispatchResult parseFeedResponse(const HttpClient::Response& response) {
    const auto activity = response.headers.find(headers::kActivityId);
    const std::string activityId =
        activity == response.headers.end() ? std::string() : activity->second;

    if (response.httpStatus < 200 || response.httpStatus >= 300) {
        Failure f = classifyFailure(response.httpStatus,
                                    headerInt(response.headers, headers::kSubStatus),
                                    errorMessage(response.body));
        f.activityId = activityId;
        return DispatchResult::failure(f);
    }

    FeedResponse page;
    page.headers    = response.headers;
    page.activityId = activityId;

    auto charge = response.headers.find(headers::kRequestCharge);
    if (charge != response.headers.end()) {
        try {
            page.requestCharge = std::stod(charge->second);
        } catch (const std::logic_error&) {
            std::cerr << "[Gateway] Warning: unparsable request charge '"
                      << charge->second << "'\n";
        }
    }

    try {
        const auto body = nlohmann::json::parse(response.body);
        if (!body.is_object() || !body.contains("Documents") || !body["Documents"].is_array()) {
            throw std::runtime_error("Response missing 'Documents' array");
        }
        for (const auto& doc : body["Documents"]) {
            page.documents.push_back(doc);
        }
    } catch (const std::exception& e) {
        Failure f;
        f.kind       = FailureKind::BadRequest;
        f.httpStatus = static_cast<int>(response.httpStatus);
        f.message    = std::string("Failed to parse query response: ") + e.what();
        f.activityId = activityId;
        return DispatchResult::failure(f);
    }

    return DispatchResult::success(std::move(page));
}

std::optional<CollectionDescriptor> parseCollection(const std::string& link,
                                                    const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("_rid") || !body["_rid"].is_string()) {
        return std::nullopt;
    }

    CollectionDescriptor c;
    c.link       = link;
    c.resourceId = body["_rid"].get<std::string>();

    if (body.contains("partitionKey") && body["partitionKey"].is_object()) {
        PartitionKeyDefinition def;
        const auto& pk = body["partitionKey"];
        if (pk.contains("paths") && pk["paths"].is_array()) {
            for (const auto& path : pk["paths"]) {
                def.paths.push_back(path.get<std::string>());
            }
        }
        if (!def.paths.empty()) c.partitionKey = def;
    }
    return c;
}

std::vector<PartitionKeyRange> parsePartitionKeyRanges(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("PartitionKeyRanges") ||
        !body["PartitionKeyRanges"].is_array()) {
        throw std::runtime_error("Response missing 'PartitionKeyRanges' array");
    }

    std::vector<PartitionKeyRange> ranges;
    for (const auto& node : body["PartitionKeyRanges"]) {
        PartitionKeyRange r;
        r.id           = node.value("id", "");
        r.minInclusive = node.value("minInclusive", "");
        r.maxExclusive = node.value("maxExclusive", "");
        if (node.contains("parents") && node["parents"].is_array()) {
            for (const auto& p : node["parents"]) {
                r.parents.push_back(p.get<std::string>());
            }
        }
        if (r.id.empty()) {
            throw std::runtime_error("Partition key range without id");
        }
        ranges.push_back(std::move(r));
    }
    return ranges;
}

nlohmann::json queryBody(const QuerySpec& query) {
    nlohmann::json body;
    body["query"]      = query.text;
    body["parameters"] = nlohmann::json::array();
    for (const auto& [name, value] : query.parameters) {
        body["parameters"].push_back({{"name", name}, {"value", value}});
    }
    return body;
}

// ---------------------------------------------------------------------------
// HttpTransport
// ---------------------------------------------------------------------------

HttpTransport::HttpTransport(std::shared_ptr<HttpClient> client, bool verbose)
    : mClient(std::move(client))
    , mVerbose(verbose) {}

DispatchResult HttpTransport::send(const QueryRequest& request,
                                   const CancellationToken& cancellation)
{
    auto wireHeaders = request.headers;
    if (request.targetPartitionKeyRangeId && !request.useGatewayMode) {
        wireHeaders[headers::kPartitionKeyRangeId] = *request.targetPartitionKeyRangeId;
        wireHeaders[headers::kCollectionRid]       = request.targetCollectionRid;
    }

    const std::string path = request.resourceLink + "/docs";
    const std::string body = queryBody(request.query).dump();

    Failure last;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (attempt > 0 && cancellation.isCancellationRequested()) {
            last.message = "Cancelled between transport retries. Last error: " + last.message;
            return DispatchResult::failure(last);
        }

        std::chrono::milliseconds backoff = computeBackoffMs(attempt);
        try {
            const auto resp = mClient->request("POST", path, wireHeaders, body);

            if (!isRetryableStatus(resp.httpStatus)) {
                return parseFeedResponse(resp);
            }

            last = parseFeedResponse(resp).failure();
            const int retryAfter = headerInt(resp.headers, headers::kRetryAfterMs);
            if (retryAfter > 0) backoff = std::chrono::milliseconds(retryAfter);

            if (mVerbose) {
                std::cerr << "[Retry] HTTP " << resp.httpStatus
                          << ", attempt " << (attempt + 1) << "/"
                          << kMaxAttempts << ", backoff "
                          << backoff.count() << " ms\n";
            }
        } catch (const std::runtime_error& e) {
            // Network / timeout: retryable.
            last = Failure{};
            last.kind    = FailureKind::Transient;
            last.message = e.what();

            if (mVerbose) {
                std::cerr << "[Retry] Network error: " << e.what()
                          << ", attempt " << (attempt + 1) << "/"
                          << kMaxAttempts << "\n";
            }
        }

        if (attempt < kMaxAttempts - 1) {
            std::this_thread::sleep_for(backoff);
        }
    }

    last.message = "Max retries exceeded. Last error: " + last.message;
    return DispatchResult::failure(last);
}

bool HttpTransport::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

// ---------------------------------------------------------------------------
// HttpMetadataSource
// ---------------------------------------------------------------------------

HttpMetadataSource::HttpMetadataSource(std::shared_ptr<HttpClient> client, bool verbose)
    : mClient(std::move(client))
    , mVerbose(verbose) {}

std::optional<CollectionDescriptor> HttpMetadataSource::readCollection(const std::string& link) {
    const auto resp = mClient->request("GET", link, {});
    if (resp.httpStatus == 404) return std::nullopt;
    if (resp.httpStatus != 200) {
        throw std::runtime_error("Reading collection " + link + " failed with HTTP "
                                 + std::to_string(resp.httpStatus) + ": "
                                 + errorMessage(resp.body));
    }

    try {
        return parseCollection(link, nlohmann::json::parse(resp.body));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse collection response: ") + e.what());
    }
}

std::optional<std::vector<PartitionKeyRange>>
HttpMetadataSource::readPartitionKeyRanges(const std::string& collectionRid) {
    const auto resp = mClient->request("GET", "colls/" + collectionRid + "/pkranges", {});
    if (resp.httpStatus == 404) return std::nullopt;
    if (resp.httpStatus != 200) {
        throw std::runtime_error("Reading partition key ranges of " + collectionRid
                                 + " failed with HTTP " + std::to_string(resp.httpStatus));
    }

    try {
        auto ranges = parsePartitionKeyRanges(nlohmann::json::parse(resp.body));
        if (mVerbose) {
            std::cerr << "[Gateway] " << ranges.size() << " partition key ranges for "
                      << collectionRid << "\n";
        }
        return ranges;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse partition key ranges: ") + e.what());
    }
}

} // namespace partition_query
