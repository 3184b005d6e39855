#include "bandwidth.hpp"

#include <algorithm>
#include <cmath>

double toRoundedKBps(std::int64_t bytesPerSec)
{
    if (bytesPerSec <= 0)
    {
        return 0.0;
    }
    return std::floor(static_cast<double>(bytesPerSec) / 1024.0 + 0.5);
}

double progressPercent(std::int64_t doneBytes, std::int64_t totalBytes)
{
    if (totalBytes <= 0 || doneBytes <= 0)
    {
        return 0.0;
    }
    double percent = static_cast<double>(doneBytes) / static_cast<double>(totalBytes) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

std::optional<Seconds> estimateEta(Seconds elapsed,
                                   std::int64_t transferredBytes,
                                   std::int64_t totalBytes)
{
    if (transferredBytes <= 0)
    {
        return std::nullopt;
    }

    std::int64_t remaining = std::max<std::int64_t>(totalBytes - transferredBytes, 0);
    double elapsedSeconds = std::max(elapsed.count(), 0.0);

    return Seconds(elapsedSeconds * static_cast<double>(remaining) / static_cast<double>(transferredBytes));
}

BandwidthSample makeBandwidthSample(const TransferStatus &status,
                                    Seconds elapsed,
                                    std::int64_t transferredBytes,
                                    std::int64_t totalBytes)
{
    BandwidthSample sample;
    sample.downloadRateKBps = toRoundedKBps(status.downloadRateBytesPerSec);
    sample.uploadRateKBps = toRoundedKBps(status.uploadRateBytesPerSec);
    sample.eta = estimateEta(elapsed, transferredBytes, totalBytes);
    return sample;
}
