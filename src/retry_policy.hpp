#pragma once

#include "errors.hpp"
#include "models.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace partition_query {

/// Per-logical-call retry bookkeeping.  Reset at the start of every fetch.
struct RetryContext {
    int  attempts        = 0;     // dispatch attempts started
    int  budgetedRetries = 0;     // retries charged to the RetryBudget
    bool collectionCacheRefreshed = false;
    bool partitionMapRefreshed    = false;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
};

/// Cache a policy wants refreshed before the next attempt.
enum class RefreshTarget {
    None,
    CollectionCache,
    PartitionMap,
};

enum class RetryDecision {
    NotClaimed,   // policy does not recognize the failure
    Retry,
    GiveUp,       // recognized, but this call already spent its refresh
};

struct RetryAdvice {
    RetryDecision             decision      = RetryDecision::NotClaimed;
    RefreshTarget             refresh       = RefreshTarget::None;
    bool                      chargesBudget = true;
    std::chrono::milliseconds backoff{0};

    static RetryAdvice notClaimed() { return {}; }
    static RetryAdvice giveUp() { return {RetryDecision::GiveUp, RefreshTarget::None, true, {}}; }
    static RetryAdvice retry(RefreshTarget target, bool chargesBudget) {
        return {RetryDecision::Retry, target, chargesBudget, {}};
    }
};

/// A "classify and advise" step.  Policies hold no state of their own; what
/// happened earlier in the call is read from the RetryContext.
class RetryPolicy {
public:
    virtual ~RetryPolicy() = default;

    virtual const char* name() const = 0;
    virtual RetryAdvice classify(const Failure& failure, const RetryContext& context) const = 0;
};

/// Stale name -> collection rid mapping: refresh the collection cache once.
/// The retry is not charged to the budget.
class InvalidPartitionRetryPolicy : public RetryPolicy {
public:
    const char* name() const override { return "InvalidPartition"; }
    RetryAdvice classify(const Failure& failure, const RetryContext& context) const override;
};

/// Targeted range split or merged away: refresh the partition map once and
/// re-resolve.
class PartitionKeyRangeGoneRetryPolicy : public RetryPolicy {
public:
    const char* name() const override { return "PartitionKeyRangeGone"; }
    RetryAdvice classify(const Failure& failure, const RetryContext& context) const override;
};

/// Upper bound on charged retries and total time spent in one logical call.
struct RetryBudget {
    int                       maxRetryAttempts = 9;
    std::chrono::milliseconds maxRetryWait{30000};

    bool allows(const RetryContext& context, const RetryAdvice& advice) const;
};

/// Ordered policy list; the first policy that claims a failure decides.
class RetryPolicyChain {
public:
    RetryPolicyChain() = default;
    RetryPolicyChain(RetryPolicyChain&&) = default;
    RetryPolicyChain& operator=(RetryPolicyChain&&) = default;

    /// Invalid-partition policy, plus the range-gone policy for partitioned
    /// resource types.
    static RetryPolicyChain forResourceType(ResourceType type);

    void add(std::unique_ptr<RetryPolicy> policy);

    /// Advice of the first claiming policy, plus its name for logging.
    RetryAdvice classify(const Failure& failure,
                         const RetryContext& context,
                         const char** claimedBy = nullptr) const;

    std::size_t size() const { return mPolicies.size(); }

private:
    std::vector<std::unique_ptr<RetryPolicy>> mPolicies;
};

} // namespace partition_query
