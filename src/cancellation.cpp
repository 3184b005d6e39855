#include "cancellation.hpp"

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]
                        { return cancelled_; });
}

Clock::TimePoint SteadyClock::now() const
{
    return std::chrono::steady_clock::now();
}

bool SteadyClock::sleepFor(std::chrono::milliseconds duration, CancellationToken &token)
{
    return !token.waitFor(duration);
}
