#include "progress_view.hpp"
#include "test_support.hpp"

int main()
{
    section("Remaining time");
    check(formatEta(std::nullopt) == "unknown", "no estimate is shown as unknown");
    check(formatEta(Seconds(0.0)) == "0s", "done");
    check(formatEta(Seconds(44.6)) == "45s", "seconds rounded");
    check(formatEta(Seconds(150.0)) == "2m 30s", "minutes and seconds");
    check(formatEta(Seconds(3725.0)) == "1h 2m", "hours and minutes");

    section("Rates");
    check(formatRate(0.0) == "0 KB/s", "idle");
    check(formatRate(1023.0) == "1023 KB/s", "below 1 MB/s in KB/s");
    check(formatRate(1536.0) == "1.50 MB/s", "from 1 MB/s in MB/s");

    section("Status line");
    ConsoleProgressView view;
    check(view.statusLine().find("0.0% | Down: 0 KB/s | Up: 0 KB/s | ETA: unknown | Seeds: 0 | Peers: 0") !=
              std::string::npos,
          "initial line shows zeros and an unknown ETA");

    BandwidthSample sample;
    sample.downloadRateKBps = 2048.0;
    sample.uploadRateKBps = 12.0;
    sample.eta = Seconds(150.0);

    view.setProgress(50.0);
    view.setBandwidth(sample);
    view.setSeeds(3);
    view.setPeers(7);

    std::string expected = "[" + std::string(15, '=') + ">" + std::string(14, ' ') + "] 50.0%"
                           " | Down: 2.00 MB/s | Up: 12 KB/s | ETA: 2m 30s | Seeds: 3 | Peers: 7";
    check(view.statusLine() == expected, "line reflects the latest values");

    view.setProgress(100.0);
    check(view.statusLine().rfind("[" + std::string(30, '=') + "] 100.0%", 0) == 0, "full bar at 100%");
    view.finish();

    return finish();
}
