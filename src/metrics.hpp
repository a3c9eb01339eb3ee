#pragma once

#include "models.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace partition_query {

/// Accumulates running time across start/stop pairs.
class SchedulingStopwatch {
public:
    using Clock = std::chrono::steady_clock;

    /// Mark the fetch as schedulable; resets accumulated time.
    void ready();
    void start();
    void stop();

    bool   isRunning() const { return mRunning; }
    double elapsedMs() const;

private:
    Clock::time_point mStartedAt{};
    Clock::duration   mAccumulated{};
    bool              mRunning = false;
};

/// Append-only log of per-attempt execution ranges.
class FetchExecutionRangeAccumulator {
public:
    using Clock = std::chrono::steady_clock;

    explicit FetchExecutionRangeAccumulator(std::string defaultPartitionId = "0");

    void beginFetchRange();

    /// Close the open range.  No-op when beginFetchRange() was not called.
    void endFetchRange(long long itemCount,
                       long long retryCount,
                       const std::string& activityId = "",
                       const std::string& partitionId = "");

    /// Ranges recorded so far, in order; the accumulator is emptied.
    std::vector<FetchExecutionRange> getExecutionRanges();

    std::size_t size() const { return mRanges.size(); }

private:
    std::string                      mDefaultPartitionId;
    Clock::time_point                mEpoch;
    Clock::time_point                mOpenedAt{};
    bool                             mOpen = false;
    std::vector<FetchExecutionRange> mRanges;
};

} // namespace partition_query
