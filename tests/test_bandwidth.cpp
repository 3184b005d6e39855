#include "bandwidth.hpp"
#include "test_support.hpp"

int main()
{
    section("Rates are whole KB/s, rounded half up");
    check(toRoundedKBps(0) == 0.0, "0 B/s is 0 KB/s");
    check(toRoundedKBps(1535) == 1.0, "1535 B/s rounds down to 1 KB/s");
    check(toRoundedKBps(1536) == 2.0, "1536 B/s (1.5 KB/s) rounds up to 2 KB/s");
    check(toRoundedKBps(1024 * 1024) == 1024.0, "1 MB/s is 1024 KB/s");
    check(toRoundedKBps(-4096) == 0.0, "negative engine rate is reported as 0");

    section("Progress percentage");
    check(progressPercent(0, 900 * 1024) == 0.0, "nothing downloaded is 0%");
    check(nearlyEqual(progressPercent(108, 900), 12.0), "108 of 900 bytes is 12%");
    check(progressPercent(1000, 900) == 100.0, "more than the total is clamped to 100%");
    check(progressPercent(10, 0) == 0.0, "empty total is 0%, not a division by zero");

    section("ETA from elapsed time");
    check(!estimateEta(Seconds(30.0), 0, 1000).has_value(), "nothing transferred: ETA unknown, not zero");

    auto eta = estimateEta(Seconds(10.0), 25, 100);
    check(eta.has_value() && nearlyEqual(eta->count(), 30.0), "25% in 10s leaves 30s");

    auto done = estimateEta(Seconds(10.0), 100, 100);
    check(done.has_value() && done->count() == 0.0, "complete transfer has ETA 0");

    auto over = estimateEta(Seconds(10.0), 150, 100);
    check(over.has_value() && over->count() == 0.0, "transfer past the total never gives a negative ETA");

    bool shrinking = true;
    double previous = estimateEta(Seconds(60.0), 1, 10000)->count();
    for (std::int64_t transferred = 2; transferred <= 10000; transferred += 97)
    {
        double current = estimateEta(Seconds(60.0), transferred, 10000)->count();
        if (current < 0.0 || current >= previous)
        {
            shrinking = false;
        }
        previous = current;
    }
    check(shrinking, "ETA shrinks as more bytes arrive in the same elapsed time");

    auto first = estimateEta(Seconds(12.5), 333, 1000);
    auto second = estimateEta(Seconds(12.5), 333, 1000);
    check(first == second, "same inputs give the same ETA");

    section("Bandwidth sample");
    TransferStatus status;
    status.downloadRateBytesPerSec = 512 * 1024 + 600;
    status.uploadRateBytesPerSec = 300;
    auto sample = makeBandwidthSample(status, Seconds(4.0), 0, 1000);
    check(sample.downloadRateKBps == 513.0, "download rate rounded to 513 KB/s");
    check(sample.uploadRateKBps == 0.0, "300 B/s rounds to 0 KB/s");
    check(!sample.eta.has_value(), "no ETA before the first byte");

    sample = makeBandwidthSample(status, Seconds(4.0), 500, 1000);
    check(sample.eta.has_value() && nearlyEqual(sample.eta->count(), 4.0), "half done in 4s leaves 4s");

    return finish();
}
