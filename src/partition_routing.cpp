#include "partition_routing.hpp"
#include "http_constants.hpp"

#include <algorithm>

namespace partition_query {

namespace {

bool ownsBounds(const PartitionKeyRange& range, const CompositeContinuationToken& token) {
    return range.id == token.rangeId && range.toRange().covers(token.range());
}

/// Children must be contiguous and together cover the token's bounds.
bool coversBounds(const std::vector<PartitionKeyRange>& children,
                  const CompositeContinuationToken& token) {
    if (children.empty()) return false;
    if (children.front().minInclusive > token.min) return false;
    if (children.back().maxExclusive < token.max) return false;
    for (std::size_t i = 1; i < children.size(); ++i) {
        if (children[i - 1].maxExclusive != children[i].minInclusive) return false;
    }
    return true;
}

} // namespace

std::vector<CompositeContinuationToken>
extractContinuation(std::map<std::string, std::string>& requestHeaders)
{
    auto it = requestHeaders.find(headers::kContinuation);
    if (it == requestHeaders.end() || it->second.empty()) return {};

    auto tokens = parseContinuation(it->second);
    it->second  = tokens.front().token;
    if (it->second.empty()) requestHeaders.erase(it);
    return tokens;
}

std::optional<ResolvedRangeInfo>
tryGetTargetRange(const std::vector<KeyRange>& providedRanges,
                  RoutingMapProvider& routingMapProvider,
                  const std::string& collectionRid,
                  const std::vector<CompositeContinuationToken>& suppliedTokens)
{
    // --- fresh query: first range of the first provided interval ---
    if (suppliedTokens.empty()) {
        // Nothing can match; only the range owning the lowest key is asked.
        const KeyRange target = providedRanges.empty()
            ? KeyRange::point(kMinimumInclusiveEffectivePartitionKey)
            : providedRanges.front();

        auto overlapping = routingMapProvider.getOverlappingRanges(
            collectionRid, target, /*forceRefresh=*/false);
        if (!overlapping || overlapping->empty()) return std::nullopt;

        return ResolvedRangeInfo{overlapping->front(), {}};
    }

    // --- resuming: is the recorded range still live? ---
    const auto& first = suppliedTokens.front();

    auto overlapping = routingMapProvider.getOverlappingRanges(
        collectionRid, first.range(), /*forceRefresh=*/false);
    if (!overlapping) return std::nullopt;

    if (overlapping->size() == 1 && ownsBounds(overlapping->front(), first)) {
        return ResolvedRangeInfo{overlapping->front(), suppliedTokens};
    }

    // The cached map may predate the token; read the authoritative map once
    // before treating the difference as a split or merge.
    overlapping = routingMapProvider.getOverlappingRanges(
        collectionRid, first.range(), /*forceRefresh=*/true);
    if (!overlapping) return std::nullopt;

    if (overlapping->size() == 1 && ownsBounds(overlapping->front(), first)) {
        return ResolvedRangeInfo{overlapping->front(), suppliedTokens};
    }
    if (!coversBounds(*overlapping, first)) return std::nullopt;

    // --- topology changed: replace the first record by its successors ---
    std::vector<CompositeContinuationToken> remapped;
    remapped.reserve(overlapping->size() + suppliedTokens.size() - 1);
    for (const auto& child : *overlapping) {
        CompositeContinuationToken t;
        t.rangeId = child.id;
        t.min     = std::max(child.minInclusive, first.min);
        t.max     = std::min(child.maxExclusive, first.max);
        t.token   = first.token;
        remapped.push_back(std::move(t));
    }
    remapped.insert(remapped.end(), suppliedTokens.begin() + 1, suppliedTokens.end());

    return ResolvedRangeInfo{overlapping->front(), std::move(remapped)};
}

bool tryAddRangeToContinuation(std::map<std::string, std::string>& responseHeaders,
                               const std::vector<KeyRange>& providedRanges,
                               RoutingMapProvider& routingMapProvider,
                               const std::string& collectionRid,
                               const ResolvedRangeInfo& resolvedRangeInfo)
{
    std::string backendContinuation;
    auto found = responseHeaders.find(headers::kContinuation);
    if (found != responseHeaders.end()) {
        backendContinuation = found->second;
    }

    auto tokens = resolvedRangeInfo.continuationTokens;

    // --- several records pending (after a split): advance within the list ---
    if (tokens.size() > 1) {
        if (!backendContinuation.empty()) {
            tokens.front().token = backendContinuation;
        } else {
            tokens.erase(tokens.begin());
        }
        responseHeaders[headers::kContinuation] = serializeContinuation(tokens);
        return true;
    }

    const PartitionKeyRange& current = resolvedRangeInfo.resolvedRange;
    const std::string currentMin = tokens.empty() ? current.minInclusive : tokens.front().min;
    const std::string currentMax = tokens.empty() ? current.maxExclusive : tokens.front().max;

    // --- current range has more ---
    if (!backendContinuation.empty()) {
        const CompositeContinuationToken stay{current.id, currentMin, currentMax, backendContinuation};
        responseHeaders[headers::kContinuation] = serializeContinuation({stay});
        return true;
    }

    // --- current range drained: next provided interval above currentMax ---
    const KeyRange remaining{currentMax, kMaximumExclusiveEffectivePartitionKey, true, false};
    auto next = std::find_if(providedRanges.begin(), providedRanges.end(),
                             [&](const KeyRange& r) { return r.overlaps(remaining); });
    if (next == providedRanges.end()) {
        responseHeaders.erase(headers::kContinuation);
        return true;
    }

    KeyRange window = *next;
    if (window.min < currentMax) {
        window.min            = currentMax;
        window.isMinInclusive = true;
    }

    auto overlapping = routingMapProvider.getOverlappingRanges(
        collectionRid, window, /*forceRefresh=*/false);
    if (!overlapping || overlapping->empty()) return false;

    const auto& nextRange = overlapping->front();
    const CompositeContinuationToken advance{
        nextRange.id, std::max(nextRange.minInclusive, window.min), nextRange.maxExclusive, ""};
    responseHeaders[headers::kContinuation] = serializeContinuation({advance});
    return true;
}

} // namespace partition_query
