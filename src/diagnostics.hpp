#pragma once

#include "models.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace partition_query {

/// Parse a server metrics header of the form "name=value;name=value".
/// Throws std::invalid_argument on a pair without '=' or a non-numeric value.
std::map<std::string, double> parseDelimitedMetrics(const std::string& delimited);

/// Server metrics combined with the client view of the same fetch.
QueryMetrics createQueryMetrics(const std::string& delimited,
                                ClientSideMetrics clientSideMetrics,
                                const std::string& activityId);

/// What the engine observed while producing one page.
struct ClientObservations {
    std::string                      partitionKeyRangeId = "0";
    long long                        retries = 0;
    std::vector<FetchExecutionRange> executionRanges;
    double                           schedulingElapsedMs = 0.0;
};

/// Attach diagnostics to a successful response.  Without server metrics the
/// response is returned as-is apart from the retry count; malformed server
/// metrics are reported on stderr and dropped.
FeedResponse attachDiagnostics(FeedResponse response,
                               const std::optional<std::string>& rawServerMetrics,
                               const ClientObservations& observations);

} // namespace partition_query
