#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Cooperative cancellation flag shared between the caller and a download.
 * cancel() may be called from any thread and wakes a pending waitFor().
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel();
    bool isCancelled() const;

    /**
     * Block for at most `timeout`, returning early on cancellation.
     * @return true if the token is cancelled when the wait ends
     */
    bool waitFor(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

/**
 * Time source of the polling loop.
 */
class Clock
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * Suspend the caller for one tick.
     * @return false if the wait was interrupted by cancellation
     */
    virtual bool sleepFor(std::chrono::milliseconds duration, CancellationToken &token) = 0;
};

// Real time, backed by std::chrono::steady_clock
class SteadyClock : public Clock
{
public:
    TimePoint now() const override;
    bool sleepFor(std::chrono::milliseconds duration, CancellationToken &token) override;
};
