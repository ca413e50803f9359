#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "../../include/media_grab/downloader/DownloadEvents.h"

namespace media_grab::downloader {

/**
 * Turns backend output and byte counters into progress events.
 * Never throws: a reporting problem is logged and the download continues.
 */
class ProgressReporter {
public:
    using Clock = std::chrono::steady_clock;

    ProgressReporter(const DownloadEvents& events, std::function<bool()> isCancelled);

    // Tool output line; machine-readable progress lines are parsed, others forwarded
    void onOutputLine(const std::string& line);

    // Byte counters from an in-process transfer; total is 0 when unknown
    void onBytes(uint64_t downloaded, uint64_t total);

    // Same as onBytes with an explicit timestamp
    void update(uint64_t downloaded, uint64_t total, Clock::time_point now);

    // Forget counters before the next attempt
    void reset();

    std::optional<int> lastPercent() const { return lastPercent_; }
    double currentSpeed() const { return speed_; }

    static std::string formatSpeed(double bytesPerSecond);
    static std::string formatEta(std::chrono::seconds remaining);

    // Parse "progress:<downloaded>:<total>:<estimate>"; false for any other line
    static bool parseProgressLine(const std::string& line, uint64_t& downloaded, uint64_t& total);

private:
    bool active() const;

    const DownloadEvents& events_;
    std::function<bool()> isCancelled_;

    std::optional<Clock::time_point> lastSample_;
    uint64_t lastBytes_ = 0;
    double speed_ = 0.0;
    std::optional<int> lastPercent_;

    static constexpr double SPEED_SMOOTHING = 0.3;
    static constexpr double MIN_ETA_SPEED = 1.0;           // bytes per second
    static constexpr double MAX_ETA_SECONDS = 30.0 * 24 * 3600;
};

} // namespace media_grab::downloader
