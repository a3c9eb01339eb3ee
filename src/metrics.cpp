#include "metrics.hpp"

namespace partition_query {

namespace {

double toMs(std::chrono::steady_clock::duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace

// ---------------------------------------------------------------------------
// SchedulingStopwatch
// ---------------------------------------------------------------------------

void SchedulingStopwatch::ready() {
    mAccumulated = Clock::duration::zero();
    mRunning     = false;
}

void SchedulingStopwatch::start() {
    if (mRunning) return;
    mStartedAt = Clock::now();
    mRunning   = true;
}

void SchedulingStopwatch::stop() {
    if (!mRunning) return;
    mAccumulated += Clock::now() - mStartedAt;
    mRunning = false;
}

double SchedulingStopwatch::elapsedMs() const {
    auto total = mAccumulated;
    if (mRunning) total += Clock::now() - mStartedAt;
    return toMs(total);
}

// ---------------------------------------------------------------------------
// FetchExecutionRangeAccumulator
// ---------------------------------------------------------------------------

FetchExecutionRangeAccumulator::FetchExecutionRangeAccumulator(std::string defaultPartitionId)
    : mDefaultPartitionId(std::move(defaultPartitionId))
    , mEpoch(Clock::now()) {}

void FetchExecutionRangeAccumulator::beginFetchRange() {
    mOpenedAt = Clock::now();
    mOpen     = true;
}

void FetchExecutionRangeAccumulator::endFetchRange(long long itemCount,
                                                   long long retryCount,
                                                   const std::string& activityId,
                                                   const std::string& partitionId)
{
    if (!mOpen) return;

    FetchExecutionRange range;
    range.activityId        = activityId;
    range.startTimeMs       = toMs(mOpenedAt - mEpoch);
    range.endTimeMs         = toMs(Clock::now() - mEpoch);
    range.partitionId       = partitionId.empty() ? mDefaultPartitionId : partitionId;
    range.numberOfDocuments = itemCount;
    range.retryCount        = retryCount;

    mRanges.push_back(std::move(range));
    mOpen = false;
}

std::vector<FetchExecutionRange> FetchExecutionRangeAccumulator::getExecutionRanges() {
    std::vector<FetchExecutionRange> out;
    out.swap(mRanges);
    return out;
}

} // namespace partition_query
