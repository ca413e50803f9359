#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../../include/media_grab/downloader/models/DownloadConfig.h"

namespace media_grab::downloader {

/**
 * Enforces a minimum interval between backend calls to the same domain.
 * Domains are tracked independently; waiting on one never delays another.
 */
class RateLimiter {
public:
    explicit RateLimiter(const DownloadConfig& config);
    RateLimiter(std::map<std::string, std::chrono::milliseconds> intervals, std::chrono::milliseconds defaultInterval);

    /**
     * Sleep until the domain's interval has elapsed since its previous call,
     * then stamp the domain with the current time.
     * @return Time actually spent waiting
     */
    std::chrono::milliseconds blockUntilAllowed(const std::string& domain);

    // Interval for a domain: longest matching configured suffix, else the default
    std::chrono::milliseconds getInterval(const std::string& domain) const;

    // Remaining wait for the domain without stamping it
    std::chrono::milliseconds getDelay(const std::string& domain) const;

private:
    std::map<std::string, std::chrono::milliseconds> intervals_;
    std::chrono::milliseconds defaultInterval_;

    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastCall_;
    mutable std::mutex mutex_;
};

} // namespace media_grab::downloader
