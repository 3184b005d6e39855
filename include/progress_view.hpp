#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "media_types.hpp"

/**
 * Format a remaining time (e.g., "2m 30s"); "unknown" when empty.
 */
std::string formatEta(const std::optional<Seconds> &eta);

/**
 * Format a KB/s rate, switching to MB/s above 1024 KB/s.
 */
std::string formatRate(double kiloBytesPerSec);

/**
 * Terminal rendering of a running download.
 *
 * Observers update the latest values; render() draws one status line.
 * On a terminal the line is redrawn in place (at most 5 times per
 * second), otherwise one line is printed per second.
 */
class ConsoleProgressView
{
public:
    ConsoleProgressView();

    void setProgress(double percent);
    void setBandwidth(const BandwidthSample &sample);
    void setSeeds(int seeds);
    void setPeers(int peers);

    // Print a message on its own line without breaking the status line
    void message(const std::string &text);

    void finish();

    /**
     * Status line for the current values, without the carriage return.
     */
    std::string statusLine() const;

private:
    void render();
    std::string composeLine() const;

    mutable std::mutex mutex_;
    bool isTerminalOutput_ = true;
    double progress_ = 0.0;
    BandwidthSample bandwidth_;
    int seeds_ = 0;
    int peers_ = 0;
    std::chrono::steady_clock::time_point lastPrintedTime_{};
};
