#pragma once

#include <cstdint>
#include <optional>

#include "media_types.hpp"

/**
 * Progress, rate and ETA arithmetic.
 * All functions are pure: same inputs, same outputs, no side effects.
 */

/**
 * Convert an engine rate to whole KB/s, rounding half up.
 * Negative rates (engine glitches) are reported as 0.
 */
double toRoundedKBps(std::int64_t bytesPerSec);

/**
 * Percentage of totalBytes already downloaded, clamped to [0, 100].
 * Returns 0 when totalBytes is not positive.
 */
double progressPercent(std::int64_t doneBytes, std::int64_t totalBytes);

/**
 * Estimate remaining time from the average speed since the start.
 *
 *   eta = elapsed * (totalBytes - transferredBytes) / transferredBytes
 *
 * @param elapsed Wall time since the transfer started
 * @param transferredBytes Bytes of the selected file already downloaded
 * @param totalBytes Bytes to download in total
 * @return Empty when nothing has been transferred yet (unknown, not zero)
 */
std::optional<Seconds> estimateEta(Seconds elapsed,
                                   std::int64_t transferredBytes,
                                   std::int64_t totalBytes);

/**
 * Build the sample reported to bandwidth observers.
 */
BandwidthSample makeBandwidthSample(const TransferStatus &status,
                                    Seconds elapsed,
                                    std::int64_t transferredBytes,
                                    std::int64_t totalBytes);
