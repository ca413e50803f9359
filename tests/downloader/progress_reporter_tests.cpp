#include <catch2/catch_test_macros.hpp>
#include "ProgressReporter.h"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace media_grab::downloader;
using namespace std::chrono;

namespace {

struct Recorded {
    std::vector<int> percents;
    std::vector<std::string> speeds;
    std::vector<std::string> etas;
    std::vector<std::string> lines;

    DownloadEvents events() {
        DownloadEvents e;
        e.percent = [this](int p) { percents.push_back(p); };
        e.speed = [this](const std::string& s) { speeds.push_back(s); };
        e.eta = [this](const std::string& s) { etas.push_back(s); };
        e.progressLine = [this](const std::string& s) { lines.push_back(s); };
        return e;
    }
};

} // namespace

TEST_CASE("ProgressReporter derives percent, speed and ETA", "[ProgressReporter]") {
    Recorded recorded;
    DownloadEvents events = recorded.events();
    bool cancelled = false;
    ProgressReporter reporter(events, [&cancelled]() { return cancelled; });
    const auto t0 = ProgressReporter::Clock::now();

    SECTION("Byte counters produce events") {
        reporter.update(0, 1000, t0);
        reporter.update(500, 1000, t0 + seconds(1));

        REQUIRE(recorded.percents == std::vector<int>{0, 50});
        REQUIRE(recorded.speeds.back() == "500.0 B/s");
        REQUIRE(recorded.etas.back() == "00:01");
    }

    SECTION("Samples too close together keep the previous speed") {
        reporter.update(0, 1000, t0);
        reporter.update(500, 1000, t0 + seconds(1));
        reporter.update(600, 1000, t0 + milliseconds(1050));

        REQUIRE(reporter.currentSpeed() == 500.0);
        REQUIRE(recorded.percents.back() == 60);
    }

    SECTION("No percentage without a total") {
        reporter.update(100, 0, t0);
        reporter.update(200, 0, t0 + seconds(1));

        REQUIRE(recorded.percents.empty());
        REQUIRE_FALSE(reporter.lastPercent().has_value());
        REQUIRE_FALSE(recorded.speeds.empty());
        REQUIRE(recorded.etas.empty());
    }

    SECTION("Nothing is reported after cancellation") {
        cancelled = true;
        reporter.update(500, 1000, t0);
        reporter.onOutputLine("[download] Destination: x.mp4");
        REQUIRE(recorded.percents.empty());
        REQUIRE(recorded.lines.empty());
    }

    SECTION("Tool output is parsed or forwarded") {
        reporter.onOutputLine("download:progress:250:1000:NA");
        reporter.onOutputLine("\x1b[0;32m[download] Destination: x.mp4\x1b[0m");

        REQUIRE(recorded.percents == std::vector<int>{25});
        REQUIRE(recorded.lines == std::vector<std::string>{"[download] Destination: x.mp4"});
    }

    SECTION("A stalled transfer reports an unknown ETA") {
        const uint64_t total = 1000ull * 1000 * 1000;
        reporter.update(0, total, t0);
        reporter.update(1000, total, t0 + seconds(1));
        for (int i = 1; i <= 200; ++i) {
            reporter.update(1000, total, t0 + seconds(1) + milliseconds(250 * i));
        }

        REQUIRE(reporter.currentSpeed() < 1.0);
        REQUIRE(recorded.etas.back() == "unknown");
        REQUIRE(recorded.speeds.back() == "0.0 B/s");
        REQUIRE(std::find(recorded.etas.begin(), recorded.etas.end(), "00:00") == recorded.etas.end());
    }

    SECTION("A very slow transfer caps the ETA") {
        const uint64_t total = 1000ull * 1000 * 1000 * 1000;
        reporter.update(0, total, t0);
        reporter.update(2, total, t0 + seconds(1));

        REQUIRE(recorded.etas.back() == "720:00:00");
    }

    SECTION("Reset forgets the previous attempt") {
        reporter.update(500, 1000, t0);
        reporter.reset();
        REQUIRE_FALSE(reporter.lastPercent().has_value());
        REQUIRE(reporter.currentSpeed() == 0.0);
    }
}

TEST_CASE("ProgressReporter survives failing listeners", "[ProgressReporter]") {
    DownloadEvents events;
    events.percent = [](int) { throw std::runtime_error("listener broke"); };
    ProgressReporter reporter(events, {});

    REQUIRE_NOTHROW(reporter.onBytes(10, 100));
    REQUIRE_NOTHROW(reporter.onOutputLine("download:progress:20:100:NA"));
}

TEST_CASE("ProgressReporter formatting and parsing", "[ProgressReporter]") {
    REQUIRE(ProgressReporter::formatSpeed(512) == "512.0 B/s");
    REQUIRE(ProgressReporter::formatSpeed(1536) == "1.5 KiB/s");
    REQUIRE(ProgressReporter::formatSpeed(3.0 * 1024 * 1024) == "3.0 MiB/s");
    REQUIRE(ProgressReporter::formatEta(seconds(65)) == "01:05");
    REQUIRE(ProgressReporter::formatEta(seconds(3725)) == "1:02:05");

    uint64_t downloaded = 0;
    uint64_t total = 0;
    REQUIRE(ProgressReporter::parseProgressLine("download:progress:1024:NA:4096", downloaded, total));
    REQUIRE(downloaded == 1024);
    REQUIRE(total == 4096);
    REQUIRE(ProgressReporter::parseProgressLine("progress:None:None:None", downloaded, total));
    REQUIRE(total == 0);
    REQUIRE_FALSE(ProgressReporter::parseProgressLine("[download]  50.0% of 10MiB", downloaded, total));
}
