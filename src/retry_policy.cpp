#include "retry_policy.hpp"

namespace partition_query {

RetryAdvice InvalidPartitionRetryPolicy::classify(const Failure& failure,
                                                  const RetryContext& context) const
{
    if (failure.kind != FailureKind::InvalidPartition) return RetryAdvice::notClaimed();
    if (context.collectionCacheRefreshed) return RetryAdvice::giveUp();
    return RetryAdvice::retry(RefreshTarget::CollectionCache, /*chargesBudget=*/false);
}

RetryAdvice PartitionKeyRangeGoneRetryPolicy::classify(const Failure& failure,
                                                       const RetryContext& context) const
{
    if (failure.kind != FailureKind::PartitionKeyRangeGone) return RetryAdvice::notClaimed();
    if (context.partitionMapRefreshed) return RetryAdvice::giveUp();
    return RetryAdvice::retry(RefreshTarget::PartitionMap, /*chargesBudget=*/true);
}

bool RetryBudget::allows(const RetryContext& context, const RetryAdvice& advice) const {
    if (advice.chargesBudget && context.budgetedRetries >= maxRetryAttempts) {
        return false;
    }
    const auto spent = std::chrono::steady_clock::now() - context.startedAt;
    return spent + advice.backoff <= maxRetryWait;
}

RetryPolicyChain RetryPolicyChain::forResourceType(ResourceType type) {
    RetryPolicyChain chain;
    chain.add(std::make_unique<InvalidPartitionRetryPolicy>());
    if (isPartitioned(type)) {
        chain.add(std::make_unique<PartitionKeyRangeGoneRetryPolicy>());
    }
    return chain;
}

void RetryPolicyChain::add(std::unique_ptr<RetryPolicy> policy) {
    mPolicies.push_back(std::move(policy));
}

RetryAdvice RetryPolicyChain::classify(const Failure& failure,
                                       const RetryContext& context,
                                       const char** claimedBy) const
{
    for (const auto& policy : mPolicies) {
        RetryAdvice advice = policy->classify(failure, context);
        if (advice.decision != RetryDecision::NotClaimed) {
            if (claimedBy) *claimedBy = policy->name();
            return advice;
        }
    }
    return RetryAdvice::notClaimed();
}

} // namespace partition_query
