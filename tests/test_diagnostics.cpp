/// @file test_diagnostics.cpp
/// Unit tests for diagnostics.hpp and metrics.hpp: server metrics parsing,
/// client-side observations and the per-attempt execution ranges.

#include "diagnostics.hpp"
#include "http_constants.hpp"
#include "metrics.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace partition_query;

// ============================================================================
// parseDelimitedMetrics
// ============================================================================

TEST(ParseDelimitedMetrics, ReadsNameValuePairs) {
    auto m = parseDelimitedMetrics(
        "totalExecutionTimeInMs=33.67;queryCompileTimeInMs=0.06;retrievedDocumentCount=2000");
    ASSERT_EQ(m.size(), 3u);
    EXPECT_DOUBLE_EQ(m["totalExecutionTimeInMs"], 33.67);
    EXPECT_DOUBLE_EQ(m["queryCompileTimeInMs"], 0.06);
    EXPECT_DOUBLE_EQ(m["retrievedDocumentCount"], 2000.0);
}

TEST(ParseDelimitedMetrics, EmptyAndTrailingSeparatorsAreIgnored) {
    EXPECT_TRUE(parseDelimitedMetrics("").empty());
    auto m = parseDelimitedMetrics("a=1;;b=2;");
    EXPECT_EQ(m.size(), 2u);
}

TEST(ParseDelimitedMetrics, MalformedPairsThrow) {
    EXPECT_THROW(parseDelimitedMetrics("novalue"), std::invalid_argument);
    EXPECT_THROW(parseDelimitedMetrics("=5"), std::invalid_argument);
    EXPECT_THROW(parseDelimitedMetrics("a=fast"), std::invalid_argument);
    EXPECT_THROW(parseDelimitedMetrics("a=12ms"), std::invalid_argument);
    EXPECT_THROW(parseDelimitedMetrics("a="), std::invalid_argument);
}

TEST(CreateQueryMetrics, CombinesServerAndClientViews) {
    ClientSideMetrics client;
    client.retries       = 2;
    client.requestCharge = 4.5;

    auto qm = createQueryMetrics("totalExecutionTimeInMs=3.2", client, "act-9");
    EXPECT_DOUBLE_EQ(qm.value("totalExecutionTimeInMs"), 3.2);
    EXPECT_DOUBLE_EQ(qm.value("missing"), 0.0);
    EXPECT_EQ(qm.clientSideMetrics.retries, 2);
    EXPECT_DOUBLE_EQ(qm.clientSideMetrics.requestCharge, 4.5);
    EXPECT_EQ(qm.activityId, "act-9");
}

// ============================================================================
// attachDiagnostics
// ============================================================================

namespace {

FeedResponse pageWith(const std::string& continuation) {
    FeedResponse page;
    page.documents     = {{{"id", "a"}}, {{"id", "b"}}};
    page.requestCharge = 3.0;
    page.activityId    = "act-1";
    if (!continuation.empty()) page.headers[headers::kContinuation] = continuation;
    return page;
}

ClientObservations observed(long long retries) {
    ClientObservations obs;
    obs.partitionKeyRangeId = "7";
    obs.retries             = retries;
    obs.schedulingElapsedMs = 12.5;
    FetchExecutionRange r;
    r.partitionId       = "7";
    r.numberOfDocuments = 2;
    obs.executionRanges = {r};
    return obs;
}

} // namespace

TEST(AttachDiagnostics, WithoutServerMetricsOnlySetsRetryCount) {
    auto page = attachDiagnostics(pageWith("more"), std::nullopt, observed(1));
    EXPECT_EQ(page.retryCount, 1);
    EXPECT_TRUE(page.queryMetrics.empty());
    EXPECT_EQ(page.count(), 2u);
    EXPECT_EQ(page.responseContinuation(), "more");
}

TEST(AttachDiagnostics, ServerMetricsAreKeyedByRange) {
    auto page = attachDiagnostics(pageWith("more"),
                                  std::string("totalExecutionTimeInMs=1.5"), observed(0));
    ASSERT_EQ(page.queryMetrics.count("7"), 1u);

    const auto& qm = page.queryMetrics.at("7");
    EXPECT_DOUBLE_EQ(qm.value("totalExecutionTimeInMs"), 1.5);
    EXPECT_EQ(qm.activityId, "act-1");
    EXPECT_DOUBLE_EQ(qm.clientSideMetrics.requestCharge, 3.0);
    ASSERT_EQ(qm.clientSideMetrics.fetchExecutionRanges.size(), 1u);
    EXPECT_EQ(qm.clientSideMetrics.fetchExecutionRanges[0].partitionId, "7");
}

TEST(AttachDiagnostics, SchedulingTimeOnlyWhenQueryFinished) {
    auto unfinished = attachDiagnostics(pageWith("more"), std::string("a=1"), observed(0));
    EXPECT_TRUE(unfinished.queryMetrics.at("7").clientSideMetrics
                    .partitionSchedulingTimeSpans.empty());

    auto finished = attachDiagnostics(pageWith(""), std::string("a=1"), observed(0));
    const auto& spans = finished.queryMetrics.at("7").clientSideMetrics.partitionSchedulingTimeSpans;
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].first, "7");
    EXPECT_DOUBLE_EQ(spans[0].second, 12.5);
}

TEST(AttachDiagnostics, MalformedServerMetricsAreDropped) {
    auto page = attachDiagnostics(pageWith(""), std::string("garbage"), observed(2));
    EXPECT_TRUE(page.queryMetrics.empty());
    EXPECT_EQ(page.retryCount, 2);
    EXPECT_EQ(page.count(), 2u);
}

// ============================================================================
// SchedulingStopwatch
// ============================================================================

TEST(SchedulingStopwatch, AccumulatesAcrossStartStop) {
    SchedulingStopwatch sw;
    sw.ready();
    EXPECT_DOUBLE_EQ(sw.elapsedMs(), 0.0);

    sw.start();
    EXPECT_TRUE(sw.isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    sw.stop();
    const double first = sw.elapsedMs();
    EXPECT_GE(first, 4.0);

    sw.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    sw.stop();
    EXPECT_GT(sw.elapsedMs(), first);
    EXPECT_FALSE(sw.isRunning());

    sw.ready();
    EXPECT_DOUBLE_EQ(sw.elapsedMs(), 0.0);
}

TEST(SchedulingStopwatch, RepeatedStartAndStopAreHarmless) {
    SchedulingStopwatch sw;
    sw.stop();
    sw.start();
    sw.start();
    sw.stop();
    sw.stop();
    EXPECT_FALSE(sw.isRunning());
    EXPECT_GE(sw.elapsedMs(), 0.0);
}

// ============================================================================
// FetchExecutionRangeAccumulator
// ============================================================================

TEST(FetchExecutionRangeAccumulator, EndWithoutBeginIsNoOp) {
    FetchExecutionRangeAccumulator acc;
    acc.endFetchRange(5, 0);
    EXPECT_EQ(acc.size(), 0u);
}

TEST(FetchExecutionRangeAccumulator, RecordsOneRangePerAttempt) {
    FetchExecutionRangeAccumulator acc;

    acc.beginFetchRange();
    acc.endFetchRange(0, 0, "act-1", "3");
    acc.beginFetchRange();
    acc.endFetchRange(10, 1, "act-2");
    acc.endFetchRange(99, 9);   // already closed

    auto ranges = acc.getExecutionRanges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].partitionId, "3");
    EXPECT_EQ(ranges[0].activityId, "act-1");
    EXPECT_EQ(ranges[1].partitionId, "0");
    EXPECT_EQ(ranges[1].numberOfDocuments, 10);
    EXPECT_EQ(ranges[1].retryCount, 1);
    EXPECT_LE(ranges[0].startTimeMs, ranges[0].endTimeMs);
    EXPECT_LE(ranges[0].endTimeMs, ranges[1].startTimeMs);
}

TEST(FetchExecutionRangeAccumulator, GetDrainsTheLog) {
    FetchExecutionRangeAccumulator acc("default");
    acc.beginFetchRange();
    acc.endFetchRange(1, 0);

    auto first = acc.getExecutionRanges();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].partitionId, "default");
    EXPECT_TRUE(acc.getExecutionRanges().empty());
}
