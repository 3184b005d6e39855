#include "progress_view.hpp"

#include <cmath>
#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

std::string formatEta(const std::optional<Seconds> &eta)
{
    if (!eta || eta->count() < 0.0)
    {
        return "unknown";
    }

    auto seconds = static_cast<long>(std::llround(eta->count()));
    if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    else
    {
        return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
    }
}

std::string formatRate(double kiloBytesPerSec)
{
    if (kiloBytesPerSec >= 1024.0)
    {
        return fmt::format("{:.2f} MB/s", kiloBytesPerSec / 1024.0);
    }
    return fmt::format("{:.0f} KB/s", kiloBytesPerSec);
}

ConsoleProgressView::ConsoleProgressView()
{
    // Detect if stdout is a terminal to decide how we render the status line
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ConsoleProgressView::setProgress(double percent)
{
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = percent;
    render();
}

void ConsoleProgressView::setBandwidth(const BandwidthSample &sample)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bandwidth_ = sample;
    render();
}

void ConsoleProgressView::setSeeds(int seeds)
{
    std::lock_guard<std::mutex> lock(mutex_);
    seeds_ = seeds;
}

void ConsoleProgressView::setPeers(int peers)
{
    std::lock_guard<std::mutex> lock(mutex_);
    peers_ = peers;
}

void ConsoleProgressView::message(const std::string &text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalOutput_)
    {
        fmt::print("\r\033[K{}\n{}\033[K", text, composeLine());
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", text);
    }
}

void ConsoleProgressView::finish()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalOutput_)
    {
        fmt::print("\n");
    }
    else
    {
        fmt::print("{}\n", composeLine());
    }
}

std::string ConsoleProgressView::statusLine() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return composeLine();
}

std::string ConsoleProgressView::composeLine() const
{
    constexpr int barWidth = 30;
    int filled = static_cast<int>((progress_ / 100.0) * barWidth);

    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    return fmt::format("{} {:.1f}% | Down: {} | Up: {} | ETA: {} | Seeds: {} | Peers: {}",
                       bar,
                       progress_,
                       formatRate(bandwidth_.downloadRateKBps),
                       formatRate(bandwidth_.uploadRateKBps),
                       formatEta(bandwidth_.eta),
                       seeds_,
                       peers_);
}

void ConsoleProgressView::render()
{
    auto now = std::chrono::steady_clock::now();
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();

    if (isTerminalOutput_)
    {
        // Update at most 5 times per second
        if (sinceLastPrint < 200)
        {
            return;
        }
        fmt::print("\r{}\033[K", composeLine());
        std::fflush(stdout);
    }
    else
    {
        // For non-terminal output (e.g., piped to file), print less frequently
        if (sinceLastPrint < 1000)
        {
            return;
        }
        fmt::print("{}\n", composeLine());
    }
    lastPrintedTime_ = now;
}
