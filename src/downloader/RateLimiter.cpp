#include "RateLimiter.h"
#include "../../include/Logger.h"

#include <thread>

namespace media_grab::downloader {

RateLimiter::RateLimiter(const DownloadConfig& config)
    : RateLimiter(config.rateLimits, config.defaultRateLimit) {
}

RateLimiter::RateLimiter(std::map<std::string, std::chrono::milliseconds> intervals, std::chrono::milliseconds defaultInterval)
    : intervals_(std::move(intervals)), defaultInterval_(defaultInterval) {
}

std::chrono::milliseconds RateLimiter::getInterval(const std::string& domain) const {
    std::chrono::milliseconds interval = defaultInterval_;
    size_t bestLength = 0;
    for (const auto& [suffix, value] : intervals_) {
        if (suffix.size() > domain.size() || suffix.size() <= bestLength) {
            continue;
        }
        bool suffixMatch = domain.compare(domain.size() - suffix.size(), suffix.size(), suffix) == 0;
        bool onBoundary = domain.size() == suffix.size() || domain[domain.size() - suffix.size() - 1] == '.';
        if (suffixMatch && onBoundary) {
            interval = value;
            bestLength = suffix.size();
        }
    }
    return interval;
}

std::chrono::milliseconds RateLimiter::getDelay(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastCall_.find(domain);
    if (it == lastCall_.end()) {
        return std::chrono::milliseconds(0);
    }
    auto readyAt = it->second + getInterval(domain);
    auto now = std::chrono::steady_clock::now();
    if (now >= readyAt) {
        return std::chrono::milliseconds(0);
    }
    // Round up so a caller sleeping this long is never early
    return std::chrono::ceil<std::chrono::milliseconds>(readyAt - now);
}

std::chrono::milliseconds RateLimiter::blockUntilAllowed(const std::string& domain) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto interval = getInterval(domain);
    const auto start = std::chrono::steady_clock::now();

    auto it = lastCall_.find(domain);
    if (it != lastCall_.end()) {
        auto readyAt = it->second + interval;
        if (start < readyAt) {
            auto wait = readyAt - start;
            LOG_DEBUG("Rate limiting " + domain + ": waiting " +
                      std::to_string(std::chrono::ceil<std::chrono::milliseconds>(wait).count()) + "ms");
            // Other domains must not wait behind this sleep
            lock.unlock();
            std::this_thread::sleep_until(readyAt);
            lock.lock();
        }
    }

    auto now = std::chrono::steady_clock::now();
    lastCall_[domain] = now;
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
}

} // namespace media_grab::downloader
