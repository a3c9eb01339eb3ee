#include "diagnostics.hpp"

#include <iostream>
#include <stdexcept>

namespace partition_query {

std::map<std::string, double> parseDelimitedMetrics(const std::string& delimited) {
    std::map<std::string, double> metrics;

    std::size_t pos = 0;
    while (pos <= delimited.size()) {
        auto end = delimited.find(';', pos);
        if (end == std::string::npos) end = delimited.size();

        const std::string pair = delimited.substr(pos, end - pos);
        pos = end + 1;
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Malformed query metric: " + pair);
        }

        const std::string name  = pair.substr(0, eq);
        const std::string value = pair.substr(eq + 1);
        try {
            std::size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            metrics[name] = parsed;
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Malformed value for query metric " + name + ": " + value);
        }
    }
    return metrics;
}

QueryMetrics createQueryMetrics(const std::string& delimited,
                                ClientSideMetrics clientSideMetrics,
                                const std::string& activityId)
{
    QueryMetrics m;
    m.serverMetrics     = parseDelimitedMetrics(delimited);
    m.clientSideMetrics = std::move(clientSideMetrics);
    m.activityId        = activityId;
    return m;
}

FeedResponse attachDiagnostics(FeedResponse response,
                               const std::optional<std::string>& rawServerMetrics,
                               const ClientObservations& observations)
{
    response.retryCount = observations.retries;

    if (!rawServerMetrics || rawServerMetrics->empty()) {
        return response;
    }

    ClientSideMetrics client;
    client.retries              = observations.retries;
    client.requestCharge        = response.requestCharge;
    client.fetchExecutionRanges = observations.executionRanges;

    // Scheduling time is only meaningful once the whole query has drained.
    if (response.responseContinuation().empty()) {
        client.partitionSchedulingTimeSpans.emplace_back(
            observations.partitionKeyRangeId, observations.schedulingElapsedMs);
    }

    try {
        response.queryMetrics[observations.partitionKeyRangeId] =
            createQueryMetrics(*rawServerMetrics, std::move(client), response.activityId);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Diagnostics] Warning: failed to parse query metrics: "
                  << e.what() << "\n";
    }
    return response;
}

} // namespace partition_query
