#pragma once

#include <atomic>
#include <memory>

namespace partition_query {

/// Read side of a cancellation flag.  A default-constructed token can never
/// be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return mFlag && mFlag->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : mFlag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> mFlag;
};

/// Owner side: hand out tokens, then cancel() from any thread.
class CancellationSource {
public:
    CancellationSource() : mFlag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(mFlag); }
    void cancel() { mFlag->store(true, std::memory_order_release); }
    bool isCancellationRequested() const { return mFlag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> mFlag;
};

} // namespace partition_query
